#include "DriverMain.hpp" // apps/common

int main(int argc, char **argv)
{
    return pulsenet::apps::driverMain(
        "loopback", argc, argv, [](const pulsenet::runtime::DriverEnv &env, auto args) {
            return pulsenet::runtime::runLoopback(env, args);
        });
}
