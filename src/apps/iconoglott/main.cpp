// Iconoglott driver: renders a DSL file, or serves the JSON message protocol
// over stdin/stdout, one message per line (C++20)

#include <dsl_parser/parser.hpp>
#include <scene_io/error_json.hpp>
#include <scene_io/scene_json.hpp>
#include <scene_model/log.hpp>
#include <scene_pipeline/pipeline.hpp>
#include <transport/render_session.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace {

void print_usage(const char* argv0) {
    (void)fprintf(stderr,
        "usage: %s [--input FILE [--dump-ast]] [--log-file PATH] [--verbose]\n"
        "  without --input, reads one JSON message per line from stdin\n",
        argv0);
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) return std::nullopt;
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

void configure_logging(const std::string& log_file, bool verbose) {
    const auto level = verbose ? spdlog::level::debug : spdlog::level::warn;
    if (!log_file.empty()) {
        try {
            auto logger = spdlog::basic_logger_mt("iconoglott_file", log_file, true);
            logger->set_level(level);
            logger->flush_on(spdlog::level::warn);
            logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
            scene_model::set_pipeline_logger(logger);
            return;
        } catch (const spdlog::spdlog_ex& ex) {
            (void)fprintf(stderr, "cannot open log file %s: %s\n", log_file.c_str(), ex.what());
        }
    }
    scene_model::pipeline_logger()->set_level(level);
}

int render_file(const std::string& path, bool dump_ast) {
    const auto source = read_file(path);
    if (!source) {
        (void)fprintf(stderr, "cannot read %s\n", path.c_str());
        return 1;
    }

    if (dump_ast) {
        const dsl_parser::ParseResult parsed = dsl_parser::parse_source(*source);
        nlohmann::json out;
        out["ast"] = scene_io::scene_to_json(parsed.scene);
        out["errors"] = scene_io::errors_to_json(parsed.errors);
        std::cout << out.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
        return 0;
    }

    const scene_render::RenderResult result = scene_pipeline::render_with_errors(*source);
    std::cout << result.document << "\n";
    for (const auto& e : result.errors) {
        std::cerr << scene_model::severity_name(e.severity) << ": " << scene_model::format_error(e) << "\n";
    }
    return scene_model::has_errors(result.errors) ? 2 : 0;
}

int serve_stdio() {
    std::mutex out_mutex;
    transport::RenderSession session([&out_mutex](const std::string& message) {
        std::lock_guard<std::mutex> lock(out_mutex);
        std::cout << message << std::endl;
    });

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) continue;
        session.handle_message(line);
    }
    scene_model::pipeline_logger()->debug("session closed after {} renders", session.renders_completed());
    return 0;
}

} // namespace

int main(int argc, char* argv[])
{
    std::string input;
    std::string log_file;
    bool dump_ast = false;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg(argv[i]);
        if (arg == "--input" && i + 1 < argc) {
            input = argv[++i];
        } else if (arg == "--log-file" && i + 1 < argc) {
            log_file = argv[++i];
        } else if (arg == "--dump-ast") {
            dump_ast = true;
        } else if (arg == "--verbose") {
            verbose = true;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    configure_logging(log_file, verbose);

    if (!input.empty()) return render_file(input, dump_ast);
    return serve_stdio();
}
