#include <iostream>
#include <memory>
#include <string>

#include <cxxopts.hpp>
#include <spdlog/spdlog.h>

#include "config.hpp"
#include "decision_engine.hpp"
#include "sidecar.hpp"
#include "verifier_gateway.hpp"
#include "verifier_transport.hpp"

int main(int argc, char** argv)
{
    cxxopts::Options cmd_options(
        "sigwarden", "Reverse proxy verifying signed HTTP requests");
    cmd_options.add_options()
        ("c,config", "Config file",
         cxxopts::value<std::string>())
        ("p,port", "Listen port", cxxopts::value<int>())
        ("u,upstream", "Upstream server URL", cxxopts::value<std::string>())
        ("v,verifier", "Verifier service URL", cxxopts::value<std::string>())
        ("m,mode", "observe or require", cxxopts::value<std::string>())
        ("t,timeout", "Verifier timeout in ms", cxxopts::value<int>())
        ("paths", "Comma-separated protected paths",
         cxxopts::value<std::string>())
        ("log-level", "trace, debug, info, warn or error",
         cxxopts::value<std::string>())
        ("h,help", "Print this message.");

    cxxopts::ParseResult opts;
    try
    {
        opts = cmd_options.parse(argc, argv);
    }
    catch(const cxxopts::exceptions::exception& e)
    {
        std::cerr << e.what() << std::endl;
        std::cerr << cmd_options.help() << std::endl;
        return 1;
    }

    if(opts.count("help"))
    {
        std::cout << cmd_options.help() << std::endl;
        return 0;
    }

    SidecarConfig config;
    if(opts.count("config"))
    {
        auto loaded = config.loadYAML(opts["config"].as<std::string>());
        if(!loaded.has_value())
        {
            spdlog::error(mw::errorMsg(loaded.error()));
            return 1;
        }
    }
    if(auto loaded = config.loadEnv(); !loaded.has_value())
    {
        spdlog::error(mw::errorMsg(loaded.error()));
        return 1;
    }

    if(opts.count("port"))
    {
        config.port = opts["port"].as<int>();
    }
    if(opts.count("upstream"))
    {
        config.upstream_url = opts["upstream"].as<std::string>();
    }
    if(opts.count("verifier"))
    {
        config.enforcement.verifier_url = opts["verifier"].as<std::string>();
    }
    if(opts.count("mode"))
    {
        auto mode = parseMode(opts["mode"].as<std::string>());
        if(!mode.has_value())
        {
            spdlog::error(mw::errorMsg(mode.error()));
            return 1;
        }
        config.enforcement.mode = *mode;
    }
    if(opts.count("timeout"))
    {
        config.enforcement.timeout =
            std::chrono::milliseconds(opts["timeout"].as<int>());
    }
    if(opts.count("paths"))
    {
        config.protected_paths = parsePathList(opts["paths"].as<std::string>());
    }
    if(opts.count("log-level"))
    {
        config.log_level = opts["log-level"].as<std::string>();
    }

    spdlog::set_level(spdlog::level::from_str(config.log_level));

    if(auto valid = config.validate(); !valid.has_value())
    {
        spdlog::error("Invalid configuration: {}", mw::errorMsg(valid.error()));
        return 1;
    }

    auto transport = HTTPVerifierTransport::create(
        config.enforcement.verifier_url, config.enforcement.timeout);
    if(!transport.has_value())
    {
        spdlog::error(mw::errorMsg(transport.error()));
        return 1;
    }

    auto engine = std::make_unique<DecisionEngine>(
        config.enforcement,
        std::make_unique<VerifierGateway>(*std::move(transport)));
    Sidecar sidecar(config, std::move(engine));
    if(auto started = sidecar.start(); !started.has_value())
    {
        spdlog::error(mw::errorMsg(started.error()));
        return 1;
    }
    sidecar.wait();
    return 0;
}
