#include "cli_options.h"
#include "common/page_range.h"
#include "engine/engine_registry.h"

#include <fmt/format.h>
#include <getopt.h>
#include <filesystem>
#include <stdexcept>
#include <vector>

namespace ocrlayer {

namespace {

// Long-only options
enum LongOption {
    OPT_SAVE_SCRIPT = 256,
    OPT_IN_PLACE,
    OPT_DRY_RUN,
    OPT_OCR_ONLY,
    OPT_CLEAR_TEXT,
    OPT_SAVE_RAW_OCR,
    OPT_RAW_OCR_TEMPLATE,
    OPT_LIST_ENGINES,
    OPT_LIST_LANGUAGES,
    OPT_RENDER,
    OPT_DPI,
    OPT_ON_ERROR,
    OPT_LOG_DIR,
    OPT_LOG_LEVEL,
};

int ParsePositiveInt(const std::string& option, const std::string& value) {
    size_t used = 0;
    int result = 0;
    try {
        result = std::stoi(value, &used);
    } catch (const std::logic_error&) {
        used = 0;
    }
    if (used == 0 || used != value.size() || result < 1) {
        throw UsageError(fmt::format("argument {}: invalid positive integer value: '{}'", option, value));
    }
    return result;
}

void SetOutput(CliOptions& options, OutputMode mode, const std::string& path) {
    if (options.output != OutputMode::None) {
        throw UsageError("only one of -o/--save-bundled, -i/--save-indirect, --save-script, "
                         "--in-place, --dry-run may be given");
    }
    options.output = mode;
    options.outputPath = path;
}

} // namespace

void CliOptions::Show() const {
    LOG_INFO("Input: {}", inputPath);
    LOG_INFO("Engine: {}", engine.empty() ? DEFAULT_ENGINE : engine);
    for (const auto& kv : engineProperties) {
        LOG_INFO("  {}={}", kv.first, kv.second);
    }
    LOG_INFO("Pages: {}", pages.empty() ? std::string("all") : pages);
    LOG_INFO("OCR only: {}", ocrOnly ? "true" : "false");
    pipeline.Show();
}

std::string UsageText(const std::string& program) {
    return fmt::format(
        "Usage: {} [options] FILE\n"
        "\n"
        "Options controlling output:\n"
        "  -o, --save-bundled FILE        save results as a new PDF\n"
        "  -i, --save-indirect FILE       save one PDF per page plus a JSON index FILE\n"
        "      --save-script FILE         save the text-layer script\n"
        "      --in-place                 save results in-place\n"
        "      --dry-run                  don't change any files\n"
        "      --ocr-only                 don't save pages without OCR\n"
        "      --clear-text               remove existing hidden text\n"
        "      --save-raw-ocr DIR         save raw OCR output\n"
        "      --raw-ocr-filename-template TEMPLATE\n"
        "                                 file naming scheme for raw OCR (default: {{id-ext}})\n"
        "\n"
        "Recognition options:\n"
        "  -e, --engine NAME              OCR engine to use (default: {})\n"
        "      --list-engines             print list of available OCR engines\n"
        "  -l, --language LANG            set recognition language\n"
        "      --list-languages           print list of available languages\n"
        "      --render mono|color        raster mode (default: color)\n"
        "      --dpi N                    render resolution, 72-600 (default: 300)\n"
        "  -p, --pages RANGE              pages to process, e.g. 17,37-42\n"
        "  -j, --jobs[=N]                 number of jobs to run simultaneously\n"
        "  -t, --details lines|words|chars\n"
        "                                 amount of text details to extract (default: words)\n"
        "\n"
        "Advanced options:\n"
        "  -D, --debug                    don't delete intermediate files\n"
        "  -X KEY=VALUE                   set an engine-specific property\n"
        "      --on-error abort|resume    error handling strategy (default: abort)\n"
        "      --log-dir DIR              also log to DIR/ocrlayer.log\n"
        "      --log-level LEVEL          trace, debug, info, warn, error or off (default: info)\n"
        "  -v, --version                  show version information and exit\n"
        "  -h, --help                     show this help message and exit\n",
        program, DEFAULT_ENGINE);
}

CliOptions ParseCommandLine(int argc, char* argv[]) {
    CliOptions options;

    static struct option long_options[] = {
        {"save-bundled",              required_argument, 0, 'o'},
        {"save-indirect",             required_argument, 0, 'i'},
        {"save-script",               required_argument, 0, OPT_SAVE_SCRIPT},
        {"in-place",                  no_argument,       0, OPT_IN_PLACE},
        {"dry-run",                   no_argument,       0, OPT_DRY_RUN},
        {"ocr-only",                  no_argument,       0, OPT_OCR_ONLY},
        {"clear-text",                no_argument,       0, OPT_CLEAR_TEXT},
        {"save-raw-ocr",              required_argument, 0, OPT_SAVE_RAW_OCR},
        {"raw-ocr-filename-template", required_argument, 0, OPT_RAW_OCR_TEMPLATE},
        {"engine",                    required_argument, 0, 'e'},
        {"list-engines",              no_argument,       0, OPT_LIST_ENGINES},
        {"language",                  required_argument, 0, 'l'},
        {"list-languages",            no_argument,       0, OPT_LIST_LANGUAGES},
        {"render",                    required_argument, 0, OPT_RENDER},
        {"dpi",                       required_argument, 0, OPT_DPI},
        {"pages",                     required_argument, 0, 'p'},
        {"jobs",                      optional_argument, 0, 'j'},
        {"details",                   required_argument, 0, 't'},
        {"debug",                     no_argument,       0, 'D'},
        {"on-error",                  required_argument, 0, OPT_ON_ERROR},
        {"log-dir",                   required_argument, 0, OPT_LOG_DIR},
        {"log-level",                 required_argument, 0, OPT_LOG_LEVEL},
        {"version",                   no_argument,       0, 'v'},
        {"help",                      no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    // Reset getopt so the parser can run more than once per process
    optind = 0;
    opterr = 0;

    int opt;
    int option_index = 0;
    while ((opt = getopt_long(argc, argv, ":o:i:e:l:p:j::t:DX:vh", long_options, &option_index)) != -1) {
        const std::string value = optarg ? optarg : "";
        try {
            switch (opt) {
                case 'o':
                    SetOutput(options, OutputMode::Bundled, value);
                    break;
                case 'i':
                    SetOutput(options, OutputMode::Indirect, value);
                    break;
                case OPT_SAVE_SCRIPT:
                    SetOutput(options, OutputMode::Script, value);
                    break;
                case OPT_IN_PLACE:
                    SetOutput(options, OutputMode::InPlace, "");
                    break;
                case OPT_DRY_RUN:
                    SetOutput(options, OutputMode::DryRun, "");
                    break;
                case OPT_OCR_ONLY:
                    options.ocrOnly = true;
                    break;
                case OPT_CLEAR_TEXT:
                    options.pipeline.clearText = true;
                    break;
                case OPT_SAVE_RAW_OCR:
                    options.pipeline.rawOcr.directory = value;
                    break;
                case OPT_RAW_OCR_TEMPLATE:
                    options.pipeline.rawOcr.filenameTemplate = value;
                    break;
                case 'e':
                    options.engine = value;
                    break;
                case OPT_LIST_ENGINES:
                    options.listEngines = true;
                    break;
                case 'l':
                    options.pipeline.language = value;
                    break;
                case OPT_LIST_LANGUAGES:
                    options.listLanguages = true;
                    break;
                case OPT_RENDER:
                    options.pipeline.render.mode = ParseRenderMode(value);
                    break;
                case OPT_DPI:
                    options.pipeline.render.dpi = ParsePositiveInt("--dpi", value);
                    break;
                case 'p':
                    options.pages = value;
                    break;
                case 'j':
                    // Bare -j: one job per processing unit
                    options.pipeline.numJobs = value.empty() ? 0 : ParsePositiveInt("-j/--jobs", value);
                    break;
                case 't':
                    options.pipeline.details = ParseTextDetails(value);
                    break;
                case 'D':
                    options.pipeline.debug = true;
                    break;
                case 'X': {
                    size_t eq = value.find('=');
                    if (eq == std::string::npos || eq == 0) {
                        throw UsageError("argument -X: expected KEY=VALUE");
                    }
                    options.engineProperties[value.substr(0, eq)] = value.substr(eq + 1);
                    break;
                }
                case OPT_ON_ERROR:
                    options.pipeline.onError = ParseErrorPolicy(value);
                    break;
                case OPT_LOG_DIR:
                    options.logger.logDir = value;
                    break;
                case OPT_LOG_LEVEL:
                    options.logger.level = value;
                    break;
                case 'v':
                    options.showVersion = true;
                    break;
                case 'h':
                    options.showHelp = true;
                    break;
                case ':':
                    throw UsageError(fmt::format("option {} requires an argument", argv[optind - 1]));
                default:
                    throw UsageError(fmt::format("unrecognized option {}", argv[optind - 1]));
            }
        } catch (const std::invalid_argument& e) {
            throw UsageError(e.what());
        }
    }

    if (options.showHelp || options.showVersion || options.listEngines || options.listLanguages) {
        return options;
    }

    std::vector<std::string> positional(argv + optind, argv + argc);
    if (positional.size() != 1) {
        throw UsageError(positional.empty() ? "the following arguments are required: FILE"
                                            : "only one input FILE may be given");
    }
    options.inputPath = positional[0];

    if (options.output == OutputMode::None) {
        throw UsageError("You must use exactly one of the following options: -o/--save-bundled, "
                         "-i/--save-indirect, --save-script, --in-place, --dry-run");
    }

    if (!options.pages.empty()) {
        std::vector<int> selected;
        try {
            selected = ParsePageNumbers(options.pages);
        } catch (const std::invalid_argument& e) {
            throw UsageError(e.what());
        }
        // e.g. an inverted range such as 42-37
        if (selected.empty()) {
            throw UsageError(fmt::format("argument -p/--pages: no pages selected by '{}'", options.pages));
        }
    }

    if (options.pipeline.rawOcr.enabled()) {
        std::error_code ec;
        if (!std::filesystem::is_directory(options.pipeline.rawOcr.directory, ec)) {
            throw UsageError(fmt::format("cannot open '{}': not a directory",
                                         options.pipeline.rawOcr.directory));
        }
    }

    std::string error_msg;
    if (!options.pipeline.Validate(error_msg)) {
        throw UsageError(error_msg);
    }
    if (!options.logger.Validate(error_msg)) {
        throw UsageError(error_msg);
    }
    return options;
}

std::unique_ptr<Saver> CreateSaver(const CliOptions& options) {
    switch (options.output) {
        case OutputMode::Bundled:
            return std::make_unique<BundledSaver>(options.outputPath);
        case OutputMode::Indirect:
            return std::make_unique<IndirectSaver>(options.outputPath);
        case OutputMode::Script:
            return std::make_unique<ScriptSaver>(options.outputPath);
        case OutputMode::InPlace:
            return std::make_unique<InPlaceSaver>();
        case OutputMode::DryRun:
            return std::make_unique<DryRunSaver>();
        case OutputMode::None:
            break;
    }
    throw UsageError("no output option given");
}

} // namespace ocrlayer
