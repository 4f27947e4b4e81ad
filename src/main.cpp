#include <atomic>
#include <csignal>
#include <cstdlib>
#include <future>
#include <memory>
#include <stdexcept>

#include <fmt/format.h>

#include <socketwrapper.hpp>

#include "config.hpp"
#include "device_discovery.hpp"
#include "http/client.hpp"
#include "http/webserver.hpp"
#include "info_fetcher.hpp"
#include "port_scanner.hpp"
#include "proxy_router.hpp"
#include "selection_state.hpp"
#include "ssdp_discovery.hpp"

#define WEBSERVER_WORKERS 8

static void block_signals(sigset_t* sigset)
{
    sigemptyset(sigset);
    sigaddset(sigset, SIGINT);
    sigaddset(sigset, SIGTERM);
    pthread_sigmask(SIG_BLOCK, sigset, nullptr);
}

int main(int argc, char* argv[])
{
    config::app_config conf = config::parse_args(argc, argv);
    if(!conf.error.empty())
    {
        fmt::print(stderr, "Error: {}\n\n", conf.error);
        config::print_usage(argv[0]);
        return EXIT_FAILURE;
    }
    if(conf.help)
    {
        config::print_usage(argv[0]);
        return EXIT_SUCCESS;
    }

    // Before any thread is started so every thread inherits the mask
    sigset_t sigset;
    block_signals(&sigset);

    proxy::selection_state state;
    state.set_device(conf.device_ip);

    http::client client;
    discovery::info_fetcher fetcher {client};
    discovery::ssdp_prober ssdp {fetcher};
    discovery::port_scanner scanner {fetcher};
    discovery::device_discovery device_discovery {state, ssdp, scanner};

    proxy::proxy_router router {state, device_discovery, client};
    router.set_web_root(conf.web_root);

    std::unique_ptr<http::webserver> server;
    try {
        server = std::make_unique<http::webserver>("0.0.0.0", conf.port,
            [&router](const http::request& req) { return router.handle(req); }, WEBSERVER_WORKERS);
    } catch(std::runtime_error& e) {
        fmt::print(stderr, "Unable to listen on port {}: {}\n", conf.port, e.what());
        return EXIT_FAILURE;
    }

    fmt::print("Starting SoundTouch proxy server on http://localhost:{}\n", conf.port);
    if(conf.device_ip)
        fmt::print("Initial device: {}\n", *conf.device_ip);
    else
        fmt::print("No device specified. Use discovery to find devices.\n");
    if(!conf.web_root.empty())
        fmt::print("Open http://localhost:{}/ in your browser\n", conf.port);

    std::atomic<bool> run_condition {true};
    std::future<int> signal_handler = std::async(std::launch::async, [&run_condition, &sigset, port = conf.port]()
    {
        int signum = 0;
        sigwait(&sigset, &signum);
        run_condition.store(false);
        fmt::print("\nServer stopped.\n");

        // Wake up the accept call of the webserver
        try {
            net::tcp_connection<net::ip_version::v4> sock {"127.0.0.1", port};
        } catch(std::runtime_error& e) {
            fmt::print(stderr, "Unable to wake up the server: {}\n", e.what());
        }

        return signum;
    });

    server->serve(run_condition);
    signal_handler.get();

    // Waits for the requests still in progress
    server.reset();

    return EXIT_SUCCESS;
}
