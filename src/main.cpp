#include "castbridge/core/application.hpp"
#include "castbridge/core/event_bus.hpp"
#include "castbridge/core/events.hpp"
#include "castbridge/services/session/session_manager.hpp"
#include "castbridge/utils/format_utils.hpp"
#include "castbridge/utils/logger.hpp"

#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {
    using namespace castbridge;

    constexpr int kVolumeStep = 10;

    std::atomic<bool> g_shutdown_requested{false};

    void handle_shutdown_signal(int) {
        g_shutdown_requested = true;
    }

    void register_signal_handlers() {
        std::signal(SIGINT, handle_shutdown_signal);
        std::signal(SIGTERM, handle_shutdown_signal);
    }

    std::unique_ptr<utils::Logger> setup_logging(utils::LogLevel level) {
        auto logger = std::make_unique<utils::Logger>(level);
        logger->add_sink(std::make_unique<utils::ConsoleSink>(isatty(STDERR_FILENO) != 0));

        auto log_path = core::ConfigManager::default_config_directory() / "castbridge.log";
        auto file_sink = std::make_unique<utils::FileSink>(log_path);
        if (file_sink->is_open()) {
            logger->add_sink(std::move(file_sink));
            std::cerr << "Logging to: " << log_path << std::endl;
        }

        return logger;
    }

    void print_help() {
        std::cout
            << "Commands:\n"
            << "  scan [cast|roku]      search the LAN for receivers\n"
            << "  list                  show known receivers\n"
            << "  filter <text> [kind]  show receivers matching text\n"
            << "  bind <n>              connect to receiver n from the last list\n"
            << "  unbind                disconnect\n"
            << "  cast <file>           play a local file\n"
            << "  url <url> [title]     play a remote URL\n"
            << "  pause | play          toggle playback\n"
            << "  stop                  stop playback\n"
            << "  seek <+N|-N|M:SS|N>   move within the media\n"
            << "  vol <0-100|+|->       set or step the volume\n"
            << "  mute                  toggle mute\n"
            << "  status                show playback state\n"
            << "  remote                show the phone remote address\n"
            << "  quit\n";
    }

    void print_devices(const std::vector<core::Device>& devices) {
        if (devices.empty()) {
            std::cout << "No receivers found.\n";
            return;
        }
        for (std::size_t i = 0; i < devices.size(); ++i) {
            const auto& device = devices[i];
            std::cout << "  [" << (i + 1) << "] " << device.name
                      << " (" << core::to_string(device.kind) << ", " << device.model
                      << ", " << device.address() << ")\n";
        }
    }

    void print_status(const core::Application& app) {
        auto device = app.bound_device();
        if (!device) {
            std::cout << "Not bound.\n";
            return;
        }
        auto state = app.playback_state();
        std::cout << device->name << ": " << core::to_string(state.status);
        if (state.media) {
            std::cout << " - " << state.media->title;
        }
        std::cout << " [" << utils::format_duration(state.position);
        if (state.duration) {
            std::cout << " / " << utils::format_duration(*state.duration);
        }
        std::cout << "] vol " << state.volume << (state.muted ? " (muted)" : "") << "\n";
        if (state.last_error) {
            std::cout << "  last error: " << state.last_error->message << "\n";
        }
    }

    std::vector<core::DeviceKind> parse_kinds(std::istringstream& args) {
        std::vector<core::DeviceKind> kinds;
        std::string label;
        while (args >> label) {
            if (auto kind = core::device_kind_from_string(label)) {
                kinds.push_back(*kind);
            } else {
                std::cout << "Unknown kind '" << label << "' ignored.\n";
            }
        }
        return kinds;
    }

    template<typename T>
    void report(const std::expected<T, core::Failure>& result, const std::string& success) {
        if (result) {
            if (!success.empty()) {
                std::cout << success << "\n";
            }
        } else {
            std::cout << "Error (" << core::to_string(result.error().error) << "): "
                      << result.error().message << "\n";
        }
    }

    void subscribe_console_events(core::SubscriptionGroup& group) {
        group.on<core::events::DeviceListChanged>(
            [](const core::events::DeviceListChanged& event) {
                for (const auto& device : event.added) {
                    std::cout << "+ " << device.name << " (" << core::to_string(device.kind) << ")\n";
                }
                for (const auto& device : event.removed) {
                    std::cout << "- " << device.name << " is gone\n";
                }
            });
        group.on<core::events::SessionPhaseChanged>(
            [](const core::events::SessionPhaseChanged& event) {
                std::cout << "Session " << core::to_string(event.current);
                if (event.device) {
                    std::cout << " (" << event.device->name << ")";
                }
                std::cout << "\n";
            });
        group.on<core::events::PlaybackStateChanged>(
            [](const core::events::PlaybackStateChanged& event) {
                if (event.previous.status != event.current.status) {
                    std::cout << "Playback " << core::to_string(event.current.status) << "\n";
                }
            });
        group.on<core::events::DeviceLost>(
            [](const core::events::DeviceLost& event) {
                std::cout << "Lost contact with " << event.device.name << " after "
                          << event.consecutive_failures << " failed polls: " << event.reason << "\n";
            });
        group.on<core::events::CommandFailed>(
            [](const core::events::CommandFailed& event) {
                std::cout << event.command << " failed: " << event.failure.message << "\n";
            });
        group.on<core::events::RelayReceived>(
            [](const core::events::RelayReceived& event) {
                std::cout << "Received " << event.display_name << " from "
                          << (event.origin.empty() ? std::string("a phone") : event.origin) << "\n";
            });
    }

    class Console {
    public:
        explicit Console(core::Application& app) : m_app(app) {}

        // False once the user asked to quit
        bool execute(const std::string& line) {
            std::istringstream args(line);
            std::string command;
            if (!(args >> command)) {
                return true;
            }
            std::string rest;
            std::getline(args >> std::ws, rest);
            std::istringstream rest_args(rest);

            if (command == "quit" || command == "exit") {
                return false;
            } else if (command == "help") {
                print_help();
            } else if (command == "scan") {
                std::cout << "Scanning...\n";
                auto answered = m_app.scan(parse_kinds(rest_args));
                std::cout << answered.size() << " receiver(s) answered.\n";
                m_listing = m_app.devices();
                print_devices(m_listing);
            } else if (command == "list") {
                m_listing = m_app.devices();
                print_devices(m_listing);
            } else if (command == "filter") {
                std::string query;
                rest_args >> query;
                m_listing = m_app.filter_devices(query, parse_kinds(rest_args));
                print_devices(m_listing);
            } else if (command == "bind") {
                bind(rest);
            } else if (command == "unbind") {
                report(m_app.unbind(), "Unbound.");
            } else if (command == "cast") {
                auto media = m_app.cast_local_file(rest);
                report(media, media ? "Casting " + media->title : std::string());
            } else if (command == "url") {
                std::string url;
                rest_args >> url;
                std::string title;
                std::getline(rest_args >> std::ws, title);
                auto media = m_app.cast_remote_url(url, title);
                report(media, media ? "Casting " + media->title : std::string());
            } else if (command == "pause" || command == "play") {
                with_session([](services::SessionController& s) { return s.play_pause(); });
            } else if (command == "stop") {
                with_session([](services::SessionController& s) { return s.stop(); });
            } else if (command == "seek") {
                seek(rest);
            } else if (command == "vol") {
                volume(rest);
            } else if (command == "mute") {
                with_session([](services::SessionController& s) { return s.toggle_mute(); });
            } else if (command == "status") {
                print_status(m_app);
            } else if (command == "remote") {
                auto url = m_app.remote_url();
                std::cout << (url.empty() ? std::string("Media server is not running.") : "Open " + url + " on your phone.")
                          << "\n";
            } else {
                std::cout << "Unknown command '" << command << "'. Type help.\n";
            }
            return true;
        }

    private:
        core::Application& m_app;
        std::vector<core::Device> m_listing;

        void bind(const std::string& arg) {
            if (m_listing.empty()) {
                m_listing = m_app.devices();
            }
            std::optional<core::Device> target;
            try {
                auto index = std::stoul(arg);
                if (index >= 1 && index <= m_listing.size()) {
                    target = m_listing[index - 1];
                }
            } catch (const std::logic_error&) {
                auto matches = m_app.filter_devices(arg);
                if (matches.size() == 1) {
                    target = matches.front();
                }
            }
            if (!target) {
                std::cout << "No such receiver; use list, then bind <n>.\n";
                return;
            }
            std::cout << "Connecting to " << target->name << "...\n";
            report(m_app.bind(target->id), "Bound to " + target->name + ".");
        }

        void seek(const std::string& arg) {
            auto state = m_app.playback_state();
            auto target = utils::parse_seek_target(arg, state.position, state.duration.value_or(0.0));
            if (!target) {
                std::cout << "Seek target not understood: " << arg << "\n";
                return;
            }
            with_session([&target](services::SessionController& s) { return s.seek_to(*target); });
        }

        void volume(const std::string& arg) {
            int level = m_app.playback_state().volume;
            if (arg == "+") {
                level += kVolumeStep;
            } else if (arg == "-") {
                level -= kVolumeStep;
            } else {
                try {
                    level = std::stoi(arg);
                } catch (const std::logic_error&) {
                    std::cout << "Volume must be 0-100, + or -\n";
                    return;
                }
            }
            level = std::clamp(level, 0, 100);
            with_session([level](services::SessionController& s) { return s.set_volume(level); });
        }

        template<typename Command>
        void with_session(Command&& command) {
            auto session = m_app.session();
            if (!session) {
                std::cout << "Application is not ready.\n";
                return;
            }
            report(command(session->get()), std::string());
        }
    };

    // Waits for a line on stdin while watching for shutdown signals
    bool read_line(std::string& line) {
        pollfd input{STDIN_FILENO, POLLIN, 0};
        while (!g_shutdown_requested) {
            int ready = ::poll(&input, 1, 200);
            if (ready > 0) {
                return static_cast<bool>(std::getline(std::cin, line));
            }
            if (ready < 0 && errno != EINTR) {
                return false;
            }
        }
        return false;
    }
} // anonymous namespace

int main(int argc, char* argv[]) {
    std::filesystem::path config_path;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [--config PATH]\n";
            return 0;
        }
    }

    {
        core::ConfigManager config_manager(config_path);
        auto level = config_manager.load() ? config_manager.get().log_level : utils::LogLevel::Info;
        utils::LoggerManager::set_instance(setup_logging(level));
    }

    CASTBRIDGE_LOG_INFO("Main", std::string("castbridge v") + CASTBRIDGE_VERSION_STRING + " starting...");

    register_signal_handlers();

    try {
        auto app_result = core::create_application(config_path);
        if (!app_result) {
            CASTBRIDGE_LOG_ERROR("Main", "Application creation failed");
            return 1;
        }

        auto app = std::move(*app_result);
        if (!app->initialize()) {
            CASTBRIDGE_LOG_ERROR("Main", "Application initialization failed");
            return 1;
        }
        if (!app->start()) {
            CASTBRIDGE_LOG_ERROR("Main", "Application start failed");
            return 1;
        }

        core::SubscriptionGroup console_events(app->event_bus());
        subscribe_console_events(console_events);

        std::cout << "\ncastbridge v" << CASTBRIDGE_VERSION_STRING << " running\n";
        if (auto remote = app->remote_url(); !remote.empty()) {
            std::cout << "Phone remote: " << remote << "\n";
        }
        std::cout << "Type help for commands, quit or Ctrl+C to exit\n" << std::endl;

        Console console(*app);
        std::string line;
        while (!g_shutdown_requested && read_line(line)) {
            if (!console.execute(line)) {
                break;
            }
        }

        CASTBRIDGE_LOG_INFO("Main", "Shutting down...");
        console_events.release();
        app->stop();

        CASTBRIDGE_LOG_INFO("Main", "Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        CASTBRIDGE_LOG_ERROR("Main", "Fatal: " + std::string(e.what()));
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
