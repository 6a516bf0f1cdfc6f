#include "common/conf.hpp"

#include <boost/asio/ip/address_v6.hpp>
#include <jsoncpp/json/json.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <limits>
#include <sstream>

#include "log/log_manager.hpp"

using namespace std;

namespace todel {

namespace {

const char* const kConfEnv = "TODEL_CONF";
const char* const kDefaultConfPath = "todel.json";
const char* const kWorkerIdEnv = "TODEL_WORKER_ID";

constexpr size_t kMaxDescriptionLen = 2048;
constexpr uint32_t kMinMessageLimit = 1024;

// @brief 读取对象中的可选字符串字段，类型不对时抛出ConfError
optional<string> OptString(const Json::Value& obj, const char* key, const string& where) {
    if (!obj.isMember(key) || obj[key].isNull()) {
        return nullopt;
    }
    const Json::Value& v = obj[key];
    if (!v.isString()) {
        throw ConfError(where + ": " + key + " must be a string");
    }
    return v.asString();
}

optional<uint64_t> OptUInt64(const Json::Value& obj, const char* key, const string& where) {
    if (!obj.isMember(key) || obj[key].isNull()) {
        return nullopt;
    }
    const Json::Value& v = obj[key];
    if (!v.isUInt64()) {
        throw ConfError(where + ": " + key + " must be a non-negative integer");
    }
    return v.asUInt64();
}

optional<int64_t> OptInt64(const Json::Value& obj, const char* key, const string& where) {
    if (!obj.isMember(key) || obj[key].isNull()) {
        return nullopt;
    }
    const Json::Value& v = obj[key];
    if (!v.isInt64()) {
        throw ConfError(where + ": " + key + " must be an integer");
    }
    return v.asInt64();
}

// @brief 取出一个子配置段，不存在时返回null
const Json::Value& Section(const Json::Value& root, const char* key, const string& where) {
    const Json::Value& v = root[key];
    if (!v.isNull() && !v.isObject()) {
        throw ConfError(where + ": [" + key + "] must be an object");
    }
    return v;
}

void CheckUrl(const optional<string>& url, const char* service, bool websocket) {
    if (url && !IsValidServiceUrl(*url, websocket)) {
        throw ConfError(string("Invalid ") + service + " url " + *url);
    }
}

void CheckFileSize(const string& size, const char* key) {
    uint64_t bytes = 0;
    try {
        bytes = ParseByteSize(size);
    } catch (const ConfError& e) {
        throw ConfError(string("Invalid file size limit for ") + key + ": " + e.what());
    }
    if (bytes == 0) {
        throw ConfError(string("File size cannot be 0: ") + key + " = " + size);
    }
}

// @brief RFC 3986 reg-name允许的字符：unreserved、sub-delims和%XX
bool IsRegNameChar(const string& s, size_t i) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    if (isalnum(c) || (c != '\0' && strchr("-._~!$&'()*+,;=", c) != nullptr)) {
        return true;
    }
    if (c == '%') {
        return i + 2 < s.size() && isxdigit(static_cast<unsigned char>(s[i + 1])) &&
               isxdigit(static_cast<unsigned char>(s[i + 2]));
    }
    return false;
}

uint64_t NowUnixMs() {
    auto now = chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>(chrono::duration_cast<chrono::milliseconds>(now).count());
}

}  // namespace

Conf Conf::Load(const string& path) {
    ifstream in(path);
    if (!in.is_open()) {
        throw ConfError("Failed to read file " + path);
    }
    stringstream ss;
    ss << in.rdbuf();
    spdlog::debug("Loading configuration from {}", path);
    return Parse(ss.str(), path);
}

Conf Conf::LoadFromEnv() {
    const char* env = getenv(kConfEnv);
    return Load(env ? string(env) : string(kDefaultConfPath));
}

Conf Conf::FromName(string instance_name) {
    Conf conf;
    conf.instance_name = std::move(instance_name);
    conf.Validate();
    return conf;
}

Conf Conf::Parse(const string& json_text, const string& source) {
    Json::Reader rr;
    Json::Value root;
    if (!rr.parse(json_text, root, false)) {
        throw ConfError("Could not parse " + source + " as valid json: " + rr.getFormattedErrorMessages());
    }
    if (!root.isObject()) {
        throw ConfError(source + ": top level must be an object");
    }

    Conf conf;
    auto name = OptString(root, "instance_name", source);
    if (!name) {
        throw ConfError(source + ": missing instance_name");
    }
    conf.instance_name = *name;
    conf.description = OptString(root, "description", source);
    if (auto level = OptString(root, "log_level", source)) {
        conf.log_level = *level;
    }

    const Json::Value& ids = Section(root, "ids", source);
    if (!ids.isNull()) {
        conf.ids.worker_id = OptInt64(ids, "worker_id", source);
        if (auto epoch = OptUInt64(ids, "epoch_ms", source)) {
            conf.ids.epoch_ms = *epoch;
        }
        if (auto spins = OptUInt64(ids, "max_wait_spins", source)) {
            conf.ids.max_wait_spins = *spins;
        }
    }

    const Json::Value& oprish = Section(root, "oprish", source);
    if (!oprish.isNull()) {
        conf.oprish.url = OptString(oprish, "url", source);
        if (auto limit = OptUInt64(oprish, "message_limit", source)) {
            if (*limit > numeric_limits<uint32_t>::max()) {
                throw ConfError(source + ": message_limit is too large");
            }
            conf.oprish.message_limit = static_cast<uint32_t>(*limit);
        }
    }

    const Json::Value& pandemonium = Section(root, "pandemonium", source);
    if (!pandemonium.isNull()) {
        conf.pandemonium.url = OptString(pandemonium, "url", source);
    }

    const Json::Value& effis = Section(root, "effis", source);
    if (!effis.isNull()) {
        conf.effis.url = OptString(effis, "url", source);
        if (auto size = OptString(effis, "file_size", source)) {
            conf.effis.file_size = *size;
        }
        if (auto size = OptString(effis, "attachment_file_size", source)) {
            conf.effis.attachment_file_size = *size;
        }
    }

    conf.Validate();
    return conf;
}

void Conf::Validate() const {
    if (instance_name.empty()) {
        throw ConfError("Instance name can not be empty");
    }
    if (description && (description->empty() || description->size() > kMaxDescriptionLen)) {
        throw ConfError("Invalid description length, must be between 1 and 2048 characters long");
    }
    if (!IsValidLogLevel(log_level)) {
        throw ConfError("Unknown log level " + log_level);
    }

    if (ids.worker_id && (*ids.worker_id < 0 || *ids.worker_id > kMaxWorkerId)) {
        throw ConfError("Worker id " + to_string(*ids.worker_id) + " is out of range [0, 1023]");
    }
    if (ids.epoch_ms > NowUnixMs()) {
        throw ConfError("ID epoch " + to_string(ids.epoch_ms) + " is in the future");
    }
    if (ids.max_wait_spins == 0) {
        throw ConfError("max_wait_spins must be positive");
    }

    if (oprish.message_limit < kMinMessageLimit) {
        throw ConfError("Message limit can not be less than 1024 characters");
    }

    CheckUrl(oprish.url, "oprish", false);
    CheckUrl(pandemonium.url, "pandemonium", true);
    CheckUrl(effis.url, "effis", false);

    CheckFileSize(effis.file_size, "effis.file_size");
    CheckFileSize(effis.attachment_file_size, "effis.attachment_file_size");
}

int64_t Conf::ResolveWorkerId(ClockSource& clock) const {
    if (ids.worker_id) {
        return *ids.worker_id;
    }
    if (const char* env = getenv(kWorkerIdEnv)) {
        try {
            // stoll会跳过前导空白，这里要求整个值都是数字
            if (!isdigit(static_cast<unsigned char>(env[0])) && env[0] != '-') {
                throw invalid_argument("leading characters");
            }
            size_t pos = 0;
            long long v = stoll(env, &pos);
            if (pos != strlen(env)) {
                throw invalid_argument("trailing characters");
            }
            return v;
        } catch (const exception&) {
            throw ConfError(string("Invalid ") + kWorkerIdEnv + " value " + env);
        }
    }
    int64_t derived = DeriveWorkerId(clock);
    spdlog::warn("No worker id configured, derived {} from the current time, which is not unique across a fleet",
                 derived);
    return derived;
}

uint64_t ParseByteSize(const string& size) {
    size_t i = 0;
    while (i < size.size() && isspace(static_cast<unsigned char>(size[i]))) ++i;

    size_t digits_beg = i;
    uint64_t value = 0;
    while (i < size.size() && isdigit(static_cast<unsigned char>(size[i]))) {
        uint64_t d = static_cast<uint64_t>(size[i] - '0');
        if (value > (numeric_limits<uint64_t>::max() - d) / 10) {
            throw ConfError("size " + size + " is too large");
        }
        value = value * 10 + d;
        ++i;
    }
    if (i == digits_beg) {
        throw ConfError("size " + size + " has no number");
    }

    while (i < size.size() && isspace(static_cast<unsigned char>(size[i]))) ++i;
    string unit;
    while (i < size.size() && !isspace(static_cast<unsigned char>(size[i]))) {
        unit.push_back(static_cast<char>(tolower(static_cast<unsigned char>(size[i]))));
        ++i;
    }
    while (i < size.size() && isspace(static_cast<unsigned char>(size[i]))) ++i;
    if (i != size.size()) {
        throw ConfError("size " + size + " has trailing characters");
    }

    uint64_t mul = 0;
    if (unit.empty() || unit == "b") mul = 1;
    else if (unit == "kb") mul = 1000ULL;
    else if (unit == "mb") mul = 1000ULL * 1000;
    else if (unit == "gb") mul = 1000ULL * 1000 * 1000;
    else if (unit == "tb") mul = 1000ULL * 1000 * 1000 * 1000;
    else if (unit == "kib") mul = 1ULL << 10;
    else if (unit == "mib") mul = 1ULL << 20;
    else if (unit == "gib") mul = 1ULL << 30;
    else if (unit == "tib") mul = 1ULL << 40;
    else throw ConfError("size " + size + " has unknown unit " + unit);

    if (value != 0 && value > numeric_limits<uint64_t>::max() / mul) {
        throw ConfError("size " + size + " is too large");
    }
    return value * mul;
}

bool IsValidServiceUrl(const string& url, bool websocket) {
    size_t sep = url.find("://");
    if (sep == string::npos || url.find_first_of(" \t\r\n") != string::npos) {
        return false;
    }
    string scheme = url.substr(0, sep);
    transform(scheme.begin(), scheme.end(), scheme.begin(),
              [](unsigned char c) { return static_cast<char>(tolower(c)); });
    bool scheme_ok = websocket ? (scheme == "ws" || scheme == "wss") : (scheme == "http" || scheme == "https");
    if (!scheme_ok) {
        return false;
    }

    // authority到第一个 / ? # 为止，之后的路径部分不做检查
    size_t auth_beg = sep + 3;
    size_t auth_end = url.find_first_of("/?#", auth_beg);
    string authority = url.substr(auth_beg, auth_end == string::npos ? string::npos : auth_end - auth_beg);

    // userinfo@host:port，userinfo取到最后一个@
    size_t at = authority.rfind('@');
    if (at != string::npos) {
        for (size_t i = 0; i < at; ++i) {
            if (!IsRegNameChar(authority, i) && authority[i] != ':') {
                return false;
            }
        }
        authority.erase(0, at + 1);
    }

    string host;
    string port;
    if (!authority.empty() && authority[0] == '[') {
        // IPv6字面量，交给asio校验
        size_t close = authority.find(']');
        if (close == string::npos) {
            return false;
        }
        boost::system::error_code ec;
        boost::asio::ip::make_address_v6(authority.substr(1, close - 1), ec);
        if (ec) {
            return false;
        }
        host = authority.substr(0, close + 1);
        string rest = authority.substr(close + 1);
        if (!rest.empty()) {
            if (rest[0] != ':') {
                return false;
            }
            port = rest.substr(1);
        }
    } else {
        size_t colon = authority.rfind(':');
        host = authority.substr(0, colon);
        if (colon != string::npos) {
            port = authority.substr(colon + 1);
        }
        for (size_t i = 0; i < host.size(); ++i) {
            if (!IsRegNameChar(host, i)) {
                return false;
            }
        }
    }
    if (host.empty()) {
        return false;
    }

    // 端口可以为空（"host:"），否则必须在0..65535
    if (port.size() > 5 || port.find_first_not_of("0123456789") != string::npos) {
        return false;
    }
    return port.empty() || stoul(port) <= 65535;
}

int64_t DeriveWorkerId(ClockSource& clock) {
    return static_cast<int64_t>((clock.NowMs() / 1000) & kMaxWorkerId);
}

}  // namespace todel
