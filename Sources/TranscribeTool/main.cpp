#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "ConfigLoader.hpp"
#include "TranscriptionService.hpp"

namespace {

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options] <command> [args]\n"
              << "Commands:\n"
              << "  add-entity <label>                 Create an entity, print its id\n"
              << "  run <entity-id> <audio> [--no-consent]\n"
              << "                                     Transcribe a clip now\n"
              << "  stats                              Print transcription statistics\n"
              << "  engines                            List engines usable on this device\n"
              << "  delete-model                       Remove the downloaded model\n"
              << "Options:\n"
              << "  --config <file>      JSON config (default: vnt.json)\n"
              << "  --memory-mb <n>      Device RAM (default: 4096)\n"
              << "  --storage-mb <n>     Free storage (default: 1024)\n"
              << "  --network <kind>     none | metered | unmetered (default: unmetered)\n"
              << "  --help, -h           Show this help message\n";
}

vnt::NetworkClass parse_network(const std::string& value) {
    if (value == "none") return vnt::NetworkClass::none;
    if (value == "metered") return vnt::NetworkClass::metered;
    return vnt::NetworkClass::unmetered;
}

void print_record(const vnt::TranscriptionStats& s) {
    std::cout << "#" << s.id << " entity=" << s.entity_id
              << " status=" << vnt::status_to_string(s.status)
              << " path=" << s.audio_file_path;
    if (s.engine_id) std::cout << " engine=" << *s.engine_id;
    if (s.duration_ms) std::cout << " duration=" << *s.duration_ms << "ms";
    if (s.processing_speed_ratio) std::cout << " ratio=" << *s.processing_speed_ratio;
    if (s.detected_language) std::cout << " lang=" << *s.detected_language;
    if (s.error_message) std::cout << " error=\"" << *s.error_message << "\"";
    std::cout << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        std::string config_path = "vnt.json";
        vnt::DeviceInfo device;
        device.total_memory_bytes      = 4096 * vnt::kBytesPerMegabyte;
        device.available_storage_bytes = 1024 * vnt::kBytesPerMegabyte;
        device.network                 = vnt::NetworkClass::unmetered;
        device.charging                = true;
        bool consent = true;

        // Parse command line arguments
        std::vector<std::string> positional;
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                config_path = argv[++i];
            } else if (arg == "--memory-mb" && i + 1 < argc) {
                device.total_memory_bytes = std::stoll(argv[++i]) * vnt::kBytesPerMegabyte;
            } else if (arg == "--storage-mb" && i + 1 < argc) {
                device.available_storage_bytes = std::stoll(argv[++i]) * vnt::kBytesPerMegabyte;
            } else if (arg == "--network" && i + 1 < argc) {
                device.network = parse_network(argv[++i]);
            } else if (arg == "--no-consent") {
                consent = false;
            } else if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else {
                positional.push_back(arg);
            }
        }

        if (positional.empty()) {
            print_usage(argv[0]);
            return 1;
        }

        vnt::TranscriptionService service(vnt::ConfigLoader::load(config_path));
        if (!service.init()) {
            std::cerr << "Error: cannot open database " << service.config().database_path << std::endl;
            return 1;
        }

        const std::string& command = positional[0];

        if (command == "add-entity" && positional.size() == 2) {
            auto id = service.database().add_entity(positional[1]);
            if (!id) {
                std::cerr << "Error: could not create entity" << std::endl;
                return 1;
            }
            std::cout << *id << std::endl;

        } else if (command == "run" && positional.size() == 3) {
            vnt::TranscriptionRequest request;
            request.entity_id       = std::stoll(positional[1]);
            request.audio_path      = positional[2];
            request.consent_granted = consent;

            vnt::JobOutcome outcome = service.run_now(request, device);
            if (!outcome.succeeded()) {
                std::cerr << "Transcription failed: "
                          << (outcome.error ? vnt::to_string(*outcome.error) : "Cancelled");
                if (!outcome.message.empty()) std::cerr << " (" << outcome.message << ")";
                std::cerr << std::endl;
                return 2;
            }
            std::cout << "[" << outcome.language_code << "] " << outcome.text << std::endl;

        } else if (command == "stats" && positional.size() == 1) {
            const vnt::StatsSummary summary = service.stats_summary();
            std::cout << "total=" << summary.total_count
                      << " success=" << summary.success_count
                      << " failed=" << summary.failed_count
                      << " pending=" << summary.pending_count << "\n";
            if (summary.average_duration_ms) {
                std::cout << "avg duration: " << *summary.average_duration_ms << "ms\n";
            }
            if (summary.average_speed_ratio) {
                std::cout << "avg speed ratio: " << *summary.average_speed_ratio << "\n";
            }
            for (const auto& record : service.stats()) {
                print_record(record);
            }

        } else if (command == "engines" && positional.size() == 1) {
            for (const auto& id : service.available_engines(device)) {
                std::cout << id << "\n";
            }

        } else if (command == "delete-model" && positional.size() == 1) {
            if (!service.delete_models()) {
                std::cerr << "Error: could not delete model" << std::endl;
                return 1;
            }
            std::cout << "Model deleted" << std::endl;

        } else {
            print_usage(argv[0]);
            return 1;
        }

        service.shutdown();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
