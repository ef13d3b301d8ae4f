#include "DriverMain.hpp" // apps/common

#include <pulsenet/runtime/Matcher.hpp>
#include <pulsenet/session/Client.hpp>

int main(int argc, char **argv)
{
    using namespace pulsenet;

    return apps::driverMain(
        "secure_client", argc, argv, [](const runtime::DriverEnv &env, auto args) {
            runtime::Matcher matcher(env.runtime, env.config.matcher);
            if (!matcher.initialize())
                return 1;

            session::Client client(env.runtime, env.config.session,
                                   runtime::clientBindAddress(env.config),
                                   env.config.driver.startTime);
            return runtime::runSecureClient(env, matcher, client, args);
        });
}
