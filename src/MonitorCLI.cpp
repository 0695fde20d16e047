/**
 * chiralmon - CLI Implementation
 */

#include "MonitorCLI.h"
#include "Version.h"
#include <boost/program_options.hpp>
#include <iostream>
#include <sstream>

namespace po = boost::program_options;

namespace chiral {

MonitorConfig MonitorCLI::parse(int argc, const char* const argv[]) {
    MonitorConfig config;

    po::options_description general("General options");
    general.add_options()
        ("help,h", "Show help message")
        ("version,V", "Show version")
        ("config,c", po::value<std::string>(), "INI config file")
    ;

    po::options_description logging("Logging options");
    logging.add_options()
        ("verbose,v", "Verbose output")
        ("quiet,q", "Quiet output (errors only)")
        ("log-level", po::value<std::string>()->default_value("info"),
         "Log level: debug, info, warning, error")
    ;

    po::options_description node("Node options");
    node.add_options()
        ("rpc-host", po::value<std::string>()->default_value("127.0.0.1"), "Node JSON-RPC host")
        ("rpc-port", po::value<unsigned>()->default_value(8545), "Node JSON-RPC port")
        ("rpc-timeout", po::value<unsigned>()->default_value(5000), "Per-request timeout (ms)")
        ("probe-interval", po::value<unsigned>()->default_value(5000), "Node liveness probe interval (ms)")
        ("data-dir,d", po::value<std::string>()->default_value("bin/geth-data"),
         "Node data directory (geth.log is read from here)")
    ;

    po::options_description mining("Mining options");
    mining.add_options()
        ("account,a", po::value<std::string>(), "Reward account")
        ("start,s", "Start mining on launch")
        ("intensity,i", po::value<unsigned>()->default_value(50), "Intensity percent (1-100)")
        ("max-workers", po::value<unsigned>()->default_value(0),
         "Worker ceiling (0 = host concurrency)")
        ("workers,t", po::value<unsigned>()->default_value(0),
         "Workers to start with (0 = derive from intensity)")
        ("poll-interval", po::value<unsigned>()->default_value(2000), "Stats poll interval (ms)")
        ("network-interval", po::value<unsigned>()->default_value(10000),
         "Network stats interval (ms)")
        ("stats-interval", po::value<unsigned>()->default_value(10000),
         "Console summary interval (ms, 0 = off)")
    ;

    po::options_description ledger("Ledger options");
    ledger.add_options()
        ("ledger-capacity", po::value<size_t>()->default_value(50), "Blocks kept in the ledger")
        ("lookback", po::value<uint64_t>()->default_value(100), "Blocks scanned per poll")
        ("block-limit", po::value<size_t>()->default_value(50), "Max blocks returned per poll")
        ("default-reward", po::value<double>()->default_value(2.0),
         "Reward credited when the node reports none")
        ("confirmations", po::value<uint64_t>()->default_value(12),
         "Depth at which a credit is confirmed")
        ("page-size", po::value<size_t>()->default_value(10), "Page size (5, 10, 20 or 50)")
    ;

    po::options_description proxy("Proxy options");
    proxy.add_options()
        ("proxy", po::value<std::vector<std::string>>()->composing(),
         "Proxy address host:port (repeatable or comma separated)")
        ("proxy-token", po::value<std::string>()->default_value(""), "Proxy credential")
        ("proxy-timeout", po::value<unsigned>()->default_value(15000), "Proxy connect timeout (ms)")
        ("proxy-refresh", po::value<unsigned>()->default_value(30000), "Proxy status resync (ms)")
    ;

    po::options_description api("API options");
    api.add_options()
        ("api-port", po::value<unsigned>()->default_value(0), "Status API port (0 = disabled)")
    ;

    po::options_description fileOptions;
    fileOptions.add(logging).add(node).add(mining).add(ledger).add(proxy).add(api);

    po::options_description all("chiralmon Options");
    all.add(general).add(fileOptions);

    try {
        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, all), vm);

        if (vm.count("help")) {
            config.showHelp = true;
            return config;
        }
        if (vm.count("version")) {
            config.showVersion = true;
            return config;
        }

        // Stored after the command line, so command line values win
        if (vm.count("config")) {
            std::string path = vm["config"].as<std::string>();
            po::store(po::parse_config_file<char>(path.c_str(), fileOptions), vm);
        }
        po::notify(vm);

        config.verbose = vm.count("verbose") > 0;
        config.quiet = vm.count("quiet") > 0;
        config.logLevel = vm["log-level"].as<std::string>();

        config.rpcHost = vm["rpc-host"].as<std::string>();
        config.rpcPort = vm["rpc-port"].as<unsigned>();
        config.rpcTimeoutMs = vm["rpc-timeout"].as<unsigned>();
        config.probeIntervalMs = vm["probe-interval"].as<unsigned>();
        config.dataDir = vm["data-dir"].as<std::string>();

        if (vm.count("account")) {
            config.account = vm["account"].as<std::string>();
        }
        config.startMining = vm.count("start") > 0;
        config.intensity = vm["intensity"].as<unsigned>();
        config.maxWorkers = vm["max-workers"].as<unsigned>();
        config.workers = vm["workers"].as<unsigned>();
        config.pollIntervalMs = vm["poll-interval"].as<unsigned>();
        config.networkIntervalMs = vm["network-interval"].as<unsigned>();
        config.statsIntervalMs = vm["stats-interval"].as<unsigned>();

        config.ledgerCapacity = vm["ledger-capacity"].as<size_t>();
        config.blockLookback = vm["lookback"].as<uint64_t>();
        config.blockLimit = vm["block-limit"].as<size_t>();
        config.defaultReward = vm["default-reward"].as<double>();
        config.confirmationDepth = vm["confirmations"].as<uint64_t>();
        config.pageSize = vm["page-size"].as<size_t>();

        if (vm.count("proxy")) {
            for (const auto& entry : vm["proxy"].as<std::vector<std::string>>()) {
                for (auto& address : splitList(entry)) {
                    config.proxies.push_back(std::move(address));
                }
            }
        }
        config.proxyToken = vm["proxy-token"].as<std::string>();
        config.proxyTimeoutMs = vm["proxy-timeout"].as<unsigned>();
        config.proxyRefreshMs = vm["proxy-refresh"].as<unsigned>();

        config.apiPort = vm["api-port"].as<unsigned>();

    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        config.invalid = true;
        return config;
    }

    if (config.intensity < 1 || config.intensity > 100) {
        std::cerr << "Error: --intensity must be between 1 and 100" << std::endl;
        config.invalid = true;
    }
    if (!isAllowedPageSize(config.pageSize)) {
        std::cerr << "Error: --page-size must be 5, 10, 20 or 50" << std::endl;
        config.invalid = true;
    }
    if (config.pollIntervalMs == 0 || config.networkIntervalMs == 0 || config.probeIntervalMs == 0) {
        std::cerr << "Error: poll intervals must be positive" << std::endl;
        config.invalid = true;
    }
    if (config.rpcPort == 0 || config.rpcPort > 65535 || config.apiPort > 65535) {
        std::cerr << "Error: ports must be 1-65535" << std::endl;
        config.invalid = true;
    }

    return config;
}

std::vector<std::string> MonitorCLI::splitList(const std::string& str) {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;

    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            result.push_back(item);
        }
    }

    return result;
}

bool MonitorCLI::isAllowedPageSize(size_t size) {
    return size == 5 || size == 10 || size == 20 || size == 50;
}

void MonitorCLI::printHelp() {
    std::cout << R"(
chiralmon v0.3.0 - Mining session and proxy monitor for a geth node

Usage: chiralmon [OPTIONS]

General Options:
  -h, --help                Show this help message
  -V, --version             Show version
  -c, --config FILE         INI config file (same option names, no dashes)

Logging Options:
  -v, --verbose             Verbose output
  -q, --quiet               Quiet output (errors only)
  --log-level LEVEL         debug, info, warning, error (default: info)

Node Options:
  --rpc-host HOST           Node JSON-RPC host (default: 127.0.0.1)
  --rpc-port PORT           Node JSON-RPC port (default: 8545)
  --rpc-timeout MS          Per-request timeout (default: 5000)
  --probe-interval MS       Liveness probe interval (default: 5000)
  -d, --data-dir DIR        Node data directory (default: bin/geth-data)

Mining Options:
  -a, --account ADDR        Reward account
  -s, --start               Start mining on launch
  -i, --intensity N         Intensity percent 1-100 (default: 50)
  --max-workers N           Worker ceiling (0 = host concurrency)
  -t, --workers N           Workers to start with (0 = from intensity)
  --poll-interval MS        Stats poll interval (default: 2000)
  --network-interval MS     Network stats interval (default: 10000)
  --stats-interval MS       Console summary interval (0 = off)

Ledger Options:
  --ledger-capacity N       Blocks kept (default: 50)
  --lookback N              Blocks scanned per poll (default: 100)
  --block-limit N           Blocks returned per poll (default: 50)
  --default-reward X        Reward when the node reports none (default: 2.0)
  --confirmations N         Confirmation depth (default: 12)
  --page-size N             5, 10, 20 or 50 (default: 10)

Proxy Options:
  --proxy ADDR              host:port, optional tcp:// ws:// wss:// prefix
                            (repeatable or comma separated)
  --proxy-token TOKEN       Proxy credential
  --proxy-timeout MS        Connect timeout (default: 15000)
  --proxy-refresh MS        Status resync interval (default: 30000)

API Options:
  --api-port PORT           Status API port (0 = disabled)

Examples:
  chiralmon -a 0xabc... --start             Start mining and monitor
  chiralmon -a 0xabc... --api-port 3000     Monitor with status API on port 3000
  chiralmon --proxy 10.0.0.5:8080,10.0.0.6:8080 --proxy-token secret
                                            Monitor two proxies

)" << std::endl;
}

void MonitorCLI::printVersion() {
    std::cout << getVersionString() << std::endl;
    std::cout << "Mining session, block ledger and proxy monitor" << std::endl;
}

}  // namespace chiral
