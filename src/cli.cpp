#include <charconv>
#include <memory>
#include <string_view>

#include "cli.hpp"
#include "../metacat/link/include/address_json.hpp"


namespace metacat::cli {


    static void usage(std::ostream& err, const std::string& prog) {
        err << "Usage: " << prog << " [options] <command> ...\n"
            << "  parse <text>                   strict parse of exactly one entity link\n"
            << "  extract <text>                 every entity link in free-form text\n"
            << "  render <entityType> <entityFQN> [fieldName [arrayFieldName [arrayFieldValue]]]\n"
            << "Options:\n"
            << "  --log-level <trace|debug|info|warn|error|none>\n"
            << "  --log-file <path>\n"
            << "  --strict-fallback              reject fallback text containing '<' or '>'\n"
            << "  --max-links <n>                cap links returned by extract (0 = unlimited)\n";
    }


    std::optional<CliOptions> parseArgs(const std::vector<std::string>& argv, std::ostream& err) {
        CliOptions opts;

        for (std::size_t i = 1; i < argv.size(); ++i) {
            std::string_view arg = argv[i];
            const bool hasValue = i + 1 < argv.size();

            if (arg == "--log-level" && hasValue) {
                auto lvl = logger::parseLevel(argv[++i]);
                if (!lvl) { err << "unknown log level: " << argv[i] << "\n"; return std::nullopt; }
                opts.level = *lvl;
            }
            else if (arg == "--log-file" && hasValue) {
                opts.logFile = argv[++i];
            }
            else if (arg == "--strict-fallback") {
                opts.codec.strictFallbackDisplay = true;
            }
            else if (arg == "--max-links" && hasValue) {
                std::string_view v = argv[++i];
                std::size_t n = 0;
                auto [p, ec] = std::from_chars(v.data(), v.data() + v.size(), n);
                if (v.empty() || ec != std::errc{} || p != v.data() + v.size()) {
                    err << "invalid --max-links value: " << v << "\n";
                    return std::nullopt;
                }
                opts.codec.maxLinksPerMessage = n;
            }
            else if (arg.size() > 2 && arg.substr(0, 2) == "--") {
                err << "unknown option: " << arg << "\n";
                return std::nullopt;
            }
            else {
                opts.args.emplace_back(arg);
            }
        }

        return opts;
    }


    nlohmann::json report(const link::LinkCodec& codec, const link::Address& a) {
        nlohmann::json j = a;
        j["link"] = codec.render(a);
        return j;
    }


    static int fail(std::ostream& err, const link::Error& e) {
        err << "error: " << link::toString(e.code) << ": " << e.message << "\n";
        return kExitCodecError;
    }


    int run(const std::vector<std::string>& argv, std::ostream& out, std::ostream& err) {
        const std::string prog = argv.empty() ? "metacat-link" : argv[0];

        auto opts = parseArgs(argv, err);
        if (!opts) return kExitUsage;

        if (opts->args.empty()) {
            usage(err, prog);
            return kExitUsage;
        }

        std::shared_ptr<logger::ILoggerSink> sink;
        if (opts->logFile) {
            auto file = std::make_shared<logger::FileSink>(*opts->logFile);
            if (!file->good()) {
                err << "Error: could not open log file `" << *opts->logFile << "`\n";
                return kExitUsage;
            }
            sink = std::move(file);
        } else {
            sink = std::make_shared<logger::StdoutSink>();
        }

        auto log = std::make_shared<logger::Logger>(sink);
        log->setLevel(opts->level);

        const link::LinkCodec codec(opts->codec, log);
        const std::string& command = opts->args[0];


        if (command == "parse")
        {
            if (opts->args.size() != 2) {
                err << "Usage: " << prog << " parse <text>\n";
                return kExitUsage;
            }

            auto res = codec.parseOne(opts->args[1]);
            if (!res.has_value()) return fail(err, *res.error);

            out << report(codec, res.get()).dump(2) << "\n";
        }
        else if (command == "extract")
        {
            if (opts->args.size() != 2) {
                err << "Usage: " << prog << " extract <text>\n";
                return kExitUsage;
            }

            auto res = codec.extractAll(opts->args[1]);
            if (!res.has_value()) return fail(err, *res.error);

            nlohmann::json list = nlohmann::json::array();
            for (auto const& a : res.get()) list.push_back(report(codec, a));
            out << list.dump(2) << "\n";
        }
        else if (command == "render")
        {
            if (opts->args.size() < 3 || opts->args.size() > 6) {
                err << "Usage: " << prog << " render <entityType> <entityFQN> [fieldName [arrayFieldName [arrayFieldValue]]]\n";
                return kExitUsage;
            }

            auto segment = [&](std::size_t i) -> std::optional<std::string> {
                if (i < opts->args.size()) return opts->args[i];
                return std::nullopt;
            };

            auto res = link::Address::make(opts->args[1], opts->args[2], segment(3), segment(4), segment(5));
            if (!res.has_value()) return fail(err, *res.error);

            out << codec.render(res.get()) << "\n";
        }
        else
        {
            err << "unknown command: " << command << "\n";
            usage(err, prog);
            return kExitUsage;
        }

        return kExitOk;
    }


} // namespace metacat::cli
