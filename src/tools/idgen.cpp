#include "tools/idgen.hpp"

#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <jsoncpp/json/json.h>
#include <spdlog/spdlog.h>

#include "common/conf.hpp"
#include "log/log_manager.hpp"

using namespace std;
namespace asio = boost::asio;

namespace todel {
namespace tools {

void Usage(const char* prog, ostream& out) {
    out << "usage:\n"
        << "  " << prog << " gen [count] [threads]\n"
        << "  " << prog << " decompose <id>...\n"
        << "count <= " << kMaxGenerateCount << ", 1 <= threads <= " << kMaxGenerateThreads << "\n"
        << "configuration is read from $TODEL_CONF (default ./todel.json)\n";
}

bool ParseUInt64(const char* s, uint64_t& out) {
    string str(s);
    if (str.empty() || str.find_first_not_of("0123456789") != string::npos) {
        return false;
    }
    try {
        out = stoull(str);
    } catch (const out_of_range&) {
        return false;
    }
    return true;
}

int GenerateIds(UIDGenerator& gen, uint64_t count, uint64_t threads, ostream& out) {
    // 每个线程把结果放在自己的槽里，全部结束后按线程顺序输出
    vector<vector<uint64_t>> results(threads);
    vector<string> errors(threads);
    {
        asio::thread_pool pool(threads);
        for (uint64_t t = 0; t < threads; ++t) {
            uint64_t quota = count / threads + (t < count % threads ? 1 : 0);
            asio::post(pool, [&gen, &results, &errors, t, quota]() {
                // 异常不能逃出线程池的任务，否则进程直接terminate
                try {
                    for (uint64_t i = 0; i < quota; ++i) {
                        results[t].push_back(gen.Generate());
                    }
                } catch (const ClockRegression& e) {
                    errors[t] = e.what();
                } catch (const exception& e) {
                    errors[t] = string("unexpected error: ") + e.what();
                }
            });
        }
        pool.join();
    }

    for (auto& ids : results) {
        for (uint64_t id : ids) {
            out << id << "\n";
        }
    }
    int rc = 0;
    for (auto& err : errors) {
        if (!err.empty()) {
            spdlog::error("ID generation failed: {}", err);
            rc = 2;
        }
    }
    return rc;
}

int RunGenerate(int argc, char** argv, ostream& out) {
    uint64_t count = 1;
    uint64_t threads = 1;
    if (argc > 2 && (!ParseUInt64(argv[2], count) || count > kMaxGenerateCount)) {
        Usage(argv[0], out);
        return 1;
    }
    if (argc > 3 && (!ParseUInt64(argv[3], threads) || threads == 0 || threads > kMaxGenerateThreads)) {
        Usage(argv[0], out);
        return 1;
    }
    if (argc > 4) {
        Usage(argv[0], out);
        return 1;
    }

    Conf conf = Conf::LoadFromEnv();
    SetLogLevel(conf.log_level);
    spdlog::info("Instance {} generating {} ids on {} threads", conf.instance_name, count, threads);

    auto clock = make_shared<SystemClockSource>(conf.ids.epoch_ms);
    UIDGenerator gen(conf.ResolveWorkerId(*clock), clock, conf.ids.max_wait_spins);
    return GenerateIds(gen, count, threads, out);
}

int RunDecompose(int argc, char** argv, ostream& out) {
    if (argc < 3) {
        Usage(argv[0], out);
        return 1;
    }
    // 先检查全部参数，避免输出一半再报错
    vector<uint64_t> ids;
    for (int i = 2; i < argc; ++i) {
        uint64_t id = 0;
        if (!ParseUInt64(argv[i], id)) {
            spdlog::error("{} is not a valid id", argv[i]);
            return 1;
        }
        ids.push_back(id);
    }

    uint64_t epoch_ms = kPlatformEpochMs;
    if (getenv("TODEL_CONF")) {
        epoch_ms = Conf::LoadFromEnv().ids.epoch_ms;
    }

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    for (uint64_t id : ids) {
        auto parts = UIDGenerator::Decompose(id);
        Json::Value obj;
        obj["id"] = Json::UInt64(id);
        obj["timestamp"] = Json::UInt64(parts.timestamp);
        obj["unix_ms"] = Json::UInt64(parts.UnixMillis(epoch_ms));
        obj["worker_id"] = Json::UInt(parts.worker_id);
        obj["sequence"] = Json::UInt(parts.sequence);
        out << Json::writeString(writer, obj) << "\n";
    }
    return 0;
}

int RunIdgen(int argc, char** argv, ostream& out) {
    if (argc < 2) {
        Usage(argc > 0 ? argv[0] : "todel_idgen", out);
        return 1;
    }
    string cmd = argv[1];
    try {
        if (cmd == "gen") {
            return RunGenerate(argc, argv, out);
        }
        if (cmd == "decompose") {
            return RunDecompose(argc, argv, out);
        }
    } catch (const exception& e) {
        spdlog::error("Exception: {}", e.what());
        return 2;
    }
    Usage(argv[0], out);
    return 1;
}

}  // namespace tools
}  // namespace todel
