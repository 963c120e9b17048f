#include <iostream>
#include <memory>
#include "config.hpp"
#include "directory_object_store.hpp"
#include "disk_space.hpp"
#include "errors.hpp"
#include "splitter.hpp"

namespace {

// Exit code when some chunks could not be synced and a rerun is needed
const int EXIT_SYNC_INCOMPLETE = 3;

void print_summary(const resplit::RunReport& report, resplit::SpaceProbe& probe, const std::string& output_dir) {
    const resplit::RunState& state = report.state;
    std::cout << "\nOperation completed!" << std::endl;

    if (report.sync) {
        const resplit::SyncReport& sync = *report.sync;
        std::cout << "Chunks verified: " << sync.verified << ", uploaded: " << sync.uploaded
                  << ", already synced: " << sync.cached << std::endl;
        if (!sync.complete()) {
            std::cout << "Chunks kept for retry: " << sync.failed.size() << std::endl;
            std::cout << "Run the command again to retry them." << std::endl;
        }
    } else {
        std::cout << "Chunks created in this session: " << state.chunks_created << std::endl;
        if (state.next_index < state.total_chunks) {
            std::cout << "Remaining chunks to create: " << report.remaining() << "\n"
                      << "Next chunk to create: " << report.next_suffix << "\n\n"
                      << "To continue, free up disk space and run the command again." << std::endl;
        } else {
            std::cout << "All chunks have been created successfully!" << std::endl;
        }
    }

    std::cout << "\nFinal disk space: " << probe.available_bytes(output_dir) / resplit::GIB
              << " GB available in " << output_dir << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string program = argc > 0 ? argv[0] : "resplit";

    resplit::RunConfiguration config;
    try {
        config = resplit::parse_arguments(argc, argv);
        if (config.show_help) {
            std::cout << resplit::usage(program);
            return 0;
        }
        config.validate();
    } catch (const resplit::ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << resplit::usage(program);
        return 1;
    }

    try {
        resplit::FilesystemSpaceProbe probe;
        std::unique_ptr<resplit::DirectoryObjectStore> store;
        if (config.sync) {
            store = std::make_unique<resplit::DirectoryObjectStore>(config.store_root, config.bucket, config.digest);
        }

        resplit::Splitter splitter(config, probe, store.get());
        resplit::RunReport report = splitter.run();
        print_summary(report, probe, config.output_dir);

        if (report.sync && !report.sync->complete()) {
            return EXIT_SYNC_INCOMPLETE;
        }
    } catch (const resplit::Error& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
