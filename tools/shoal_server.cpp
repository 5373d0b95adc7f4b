#include "shoal/cluster/coordinator.hpp"
#include "shoal_server/options.hpp"

#include <iostream>

using namespace shoal_server;

int main(int argc, char** argv) {
    auto opts = parse_args(argc, argv);

    auto loaded = load_env_file(opts.env_file.value_or(".env"));
    if (!loaded && opts.env_file) {
        std::cerr << "Error: " << loaded.error() << "\n";
        return 1;
    }

    auto config = resolve_config(opts);
    if (!config) {
        std::cerr << "Error: " << config.error() << "\n\n";
        print_usage(1);
    }

    try {
        shoal::cluster::coordinator coordinator(std::move(*config));
        return coordinator.run();
    } catch (const std::exception& e) {
        std::cerr << "[coordinator] Fatal error: " << e.what() << "\n";
        return 1;
    }
}
