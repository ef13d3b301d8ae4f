#include "DriverMain.hpp" // apps/common

int main(int argc, char **argv)
{
    return pulsenet::apps::driverMain(
        "client", argc, argv, [](const pulsenet::runtime::DriverEnv &env, auto args) {
            return pulsenet::runtime::runInsecureClient(env, args);
        });
}
