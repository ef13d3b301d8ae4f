#include "DriverMain.hpp" // apps/common

int main(int argc, char **argv)
{
    return pulsenet::apps::driverMain("soak", argc, argv,
                                      [](const pulsenet::runtime::DriverEnv &env, auto) {
                                          return pulsenet::runtime::runSoak(env, {});
                                      });
}
