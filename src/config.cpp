#include "config.hpp"
#include "util/log.hpp"

#include <google/protobuf/text_format.h>
#include <google/protobuf/io/tokenizer.h>
#include <google/protobuf/io/zero_copy_stream_impl.h>

extern "C" {
#include <stdlib.h>
#include <errno.h>
#include <sys/stat.h>
}

class TProtobufLogger : public google::protobuf::io::ErrorCollector {
public:
    std::string Path;
    std::string Errors;
    TProtobufLogger(const std::string &path) : Path(path) {}
    ~TProtobufLogger() {}

    void AddError(int line, int column, const std::string& message) {
        L_WRN("Config {} at line {} column {} {}", Path, line + 1, column + 1, message);
        if (Errors.empty())
            Errors = fmt::format("line {} column {} {}", line + 1, column + 1, message);
    }

    void AddWarning(int line, int column, const std::string& message) {
        L_WRN("Config {} at line {} column {} {}", Path, line + 1, column + 1, message);
    }
};

static cfg::TConfig Config;

cfg::TConfig &config() {
    return Config;
}

std::vector<TPath> ConfigSearchPath() {
    std::vector<TPath> paths = {
        "cocoon",
        "cocoon.conf",
        ".cocoon",
        ".cocoon.conf",
    };

    const char *home = getenv("HOME");
    if (home && home[0]) {
        TPath dir(home);
        paths.push_back(dir / ".cocoon");
        paths.push_back(dir / ".cocoon.conf");
        paths.push_back(dir / ".config/cocoon");
        paths.push_back(dir / ".config/cocoon.conf");
        paths.push_back(dir / ".config/cocoon/config");
        paths.push_back(dir / ".config/cocoon/config.conf");
    }

    paths.push_back("/etc/cocoon.conf");
    paths.push_back("/etc/cocoon/config.conf");

    return paths;
}

TError ParseConfig(const std::string &text, cfg::TConfig &cfg) {
    google::protobuf::TextFormat::Parser parser;
    TProtobufLogger logger("<text>");

    parser.RecordErrorsTo(&logger);
    cfg.Clear();
    if (!parser.ParseFromString(text, &cfg))
        return TError(EError::InvalidConfig, "Cannot parse config: {}", logger.Errors);

    return OK;
}

TError ReadConfig(const TPath &path) {
    TError error;
    TFile file;

    error = file.OpenRead(path);
    if (error)
        return TError(EError::InvalidConfig, error.Errno, "Cannot read config {}", path);

    google::protobuf::io::FileInputStream stream(file.Fd);
    google::protobuf::TextFormat::Parser parser;
    TProtobufLogger logger(path.ToString());

    L_SYS("Read config {}", path);
    parser.RecordErrorsTo(&logger);

    Config.Clear();
    if (!parser.Parse(&stream, &Config))
        return TError(EError::InvalidConfig, "Cannot parse config {}: {}", path, logger.Errors);

    Debug |= Config.log().debug();
    Verbose |= Debug | Config.log().verbose();

    return OK;
}

TError ReadConfigs(TPath &found) {
    for (auto &path: ConfigSearchPath()) {
        struct stat st;

        /* skip directories and our own binary in cwd */
        if (path.StatFollow(st) || !S_ISREG(st.st_mode) || (st.st_mode & 0111))
            continue;
        found = path;
        return ReadConfig(path);
    }

    L_VERBOSE("No config found, using empty");
    found = TPath();
    Config.Clear();

    return OK;
}
