#include <iostream>
#include <memory>
#include <string>

#include <cxxopts.hpp>
#include <spdlog/spdlog.h>

#include "app.hpp"
#include "config.hpp"
#include "crypto.hpp"
#include "did_key.hpp"
#include "error.hpp"
#include "storage_factory.hpp"

int main(int argc, char** argv)
{
    cxxopts::Options cmd_options("was-server",
                                 "Wallet Attached Storage server");
    cmd_options.add_options()
        ("c,config", "Config file", cxxopts::value<std::string>())
        ("b,backend", "Storage backend (memory, filesystem, sqlite)",
         cxxopts::value<std::string>())
        ("keygen", "Generate an Ed25519 key pair for a client and exit.")
        ("h,help", "Print this message.");
    auto opts = cmd_options.parse(argc, argv);

    if(opts.count("help"))
    {
        std::cout << cmd_options.help() << std::endl;
        return 0;
    }

    if(opts.count("keygen"))
    {
        Crypto c;
        KeyPair keys = c.createKeyPair();
        PublicKey pub;
        pub.value = keys.public_key;
        const std::string_view private_key(
            reinterpret_cast<const char*>(keys.private_key.data()),
            keys.private_key.size());
        std::cout << "did: " << encodeDidKey(pub) << std::endl;
        std::cout << "private key: " << base64UrlEncode(private_key)
                  << std::endl;
        return 0;
    }

    Config& config = Config::get();
    if(opts.count("config"))
    {
        auto load_result = config.load(opts["config"].as<std::string>());
        if(!load_result.has_value())
        {
            spdlog::error("Failed to load config: {}",
                          errorMsg(load_result.error()));
            return 1;
        }
    }
    config.applyEnv();
    if(opts.count("backend"))
    {
        config.storage.backend = opts["backend"].as<std::string>();
    }

    spdlog::set_level(spdlog::level::from_str(config.log_level));

    auto storage = createStorage(config.storage);
    if(!storage.has_value())
    {
        spdlog::error("Failed to create storage: {}",
                      errorMsg(storage.error()));
        return 1;
    }

    App app(config, *std::move(storage));
    return app.start() ? 0 : 1;
}
