#pragma once

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <CLI/CLI.hpp>

#include "lightsync/core/config.hpp"

#include "common/logger.hpp"
#include "common/cli/validators.hpp"


namespace lightsync::examples::cli::stream {

    // -------------------------------------------------------------
    // Stream example parameters
    // -------------------------------------------------------------
    struct Params {
        std::string url                    = std::string(DEFAULT_WS_URL);
        std::vector<std::string> books     = {};
        std::vector<std::string> trades    = {};
        std::string wallet                 = {};
        std::string auth_token             = {};
        std::string price_history          = {};
        std::string resolution             = "1m";
        std::uint32_t depth                = 5;
        std::uint32_t reconnect_attempts   = 10;
        bool auto_resync                   = false;
        std::string log_level              = "info";

        inline void dump(const std::string& header, std::ostream& os) const {
            os << header << ":\n"
               << "  URL           : " << url << "\n"
               << "  Books         : ";
            for (const auto& b : books) { os << b << " "; }
            os << "\n  Trades        : ";
            for (const auto& t : trades) { os << t << " "; }
            os << "\n"
               << "  Wallet        : " << (wallet.empty() ? "-" : wallet) << "\n"
               << "  Price history : " << (price_history.empty() ? "-" : price_history + " @ " + resolution) << "\n"
               << "  Depth         : " << depth << "\n"
               << "  Reconnects    : " << reconnect_attempts << "\n"
               << "  Gap policy    : " << (auto_resync ? "AutoResync" : "Notify") << "\n"
               << "  Log Level     : " << log_level << "\n";
        }

        [[nodiscard]]
        inline Config to_config() const {
            Config cfg;
            cfg.url = url;
            cfg.reconnect_attempts = reconnect_attempts;
            cfg.gap_policy = auto_resync ? GapPolicy::AutoResync : GapPolicy::Notify;
            if (!auth_token.empty()) {
                cfg.auth_token = auth_token;
            }
            return cfg;
        }
    };

    // -------------------------------------------------------------
    // Build CLI for the stream example
    // -------------------------------------------------------------
    [[nodiscard]]
    inline Params configure(int argc, char** argv, std::string_view description) {
        CLI::App app{std::string(description)};
        Params params{};
        app.add_option("--url", params.url, "WebSocket URL")->check(ws_url_validator)->default_val(params.url);
        app.add_option("-b,--book", params.books, "Orderbook id(s) to mirror (e.g. -b ob1 -b ob2)");
        app.add_option("-t,--trades", params.trades, "Orderbook id(s) to stream trades for");
        app.add_option("-w,--wallet", params.wallet, "Wallet to follow on the user channel");
        app.add_option("--auth-token", params.auth_token, "Auth token sent as cookie on the upgrade request");
        app.add_option("-p,--price-history", params.price_history, "Orderbook id to stream candles for");
        app.add_option("-r,--resolution", params.resolution, "Candle resolution")->check(resolution_validator)->default_val(params.resolution);
        app.add_option("-d,--depth", params.depth, "Levels printed per side")->check(CLI::Range(1u, 100u))->default_val(params.depth);
        app.add_option("--reconnect-attempts", params.reconnect_attempts, "Reconnect attempts before giving up")->default_val(params.reconnect_attempts);
        app.add_flag("--auto-resync", params.auto_resync, "Re-subscribe a book automatically after a sequence gap");
        app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->check(log_level_validator)->default_val(params.log_level);
        app.footer(
            "This example runs until interrupted.\n"
            "Press Ctrl+C to disconnect and exit cleanly."
        );
        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            app.exit(e, std::cout, std::cerr);
            std::exit(EXIT_FAILURE);
        }
        // -------------------------------------------------------------
        // Logging
        // -------------------------------------------------------------
        set_log_level(params.log_level);
        return params;
    }

} // namespace lightsync::examples::cli::stream
