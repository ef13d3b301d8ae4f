#include "DriverMain.hpp" // apps/common

int main(int argc, char **argv)
{
    return pulsenet::apps::driverMain(
        "client_server", argc, argv, [](const pulsenet::runtime::DriverEnv &env, auto args) {
            return pulsenet::runtime::runClientServer(env, args);
        });
}
