#include "util/config_parser.hpp"

#include "util/config_json_utils.hpp"

namespace imgjoin::config {

void JoinerConfigFromFile::Reset() {
    default_output.reset();
    buffer_size.reset();
    fsync_output.reset();
    log_level.reset();
}

Result JoinerConfigFromFile::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail(ErrorKind::Config, "config: " + err);
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        Reset();
        return Result::Fail(ErrorKind::Config, "config: " + err + " in " + path);
    }

    return Result::Ok();
}

} // namespace imgjoin::config
