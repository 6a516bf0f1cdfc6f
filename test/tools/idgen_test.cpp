// GTest for the todel_idgen command-line tool

#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

#include <gtest/gtest.h>
#include <jsoncpp/json/json.h>

#include "common/scoped_env.hpp"
#include "ids/manual_clock.hpp"
#include "ids/snowflake_id.hpp"
#include "tools/idgen.hpp"

using namespace todel;
using namespace todel::tools;
using todel::test::ManualClock;
using todel::test::ScopedEnv;
using todel::test::WriteTempFile;
using namespace std;

namespace {

// 用字符串列表模拟argc/argv，argv[0]固定为todel_idgen
class Args {
   public:
    Args(initializer_list<string> args) : strs_{"todel_idgen"} {
        strs_.insert(strs_.end(), args);
        for (auto& s : strs_) {
            ptrs_.push_back(s.data());
        }
        ptrs_.push_back(nullptr);
    }
    int Argc() const { return static_cast<int>(strs_.size()); }
    char** Argv() { return ptrs_.data(); }

   private:
    vector<string> strs_;
    vector<char*> ptrs_;
};

int Run(initializer_list<string> args, string* output = nullptr) {
    Args a(args);
    ostringstream out;
    int rc = RunIdgen(a.Argc(), a.Argv(), out);
    if (output) {
        *output = out.str();
    }
    return rc;
}

vector<string> Lines(const string& text) {
    vector<string> lines;
    istringstream in(text);
    string line;
    while (getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

// 读到第n次时抛出非ClockRegression的异常
class FailingClock : public ClockSource {
   public:
    explicit FailingClock(uint64_t fail_at) : fail_at_(fail_at) {}
    uint64_t NowMs() override {
        if (++reads_ >= fail_at_) {
            throw length_error("clock backend gone");
        }
        return reads_;
    }

   private:
    uint64_t fail_at_;
    uint64_t reads_{0};
};

}  // namespace

TEST(IdgenTest, ParseUInt64) {
    uint64_t v = 0;
    ASSERT_TRUE(ParseUInt64("0", v));
    ASSERT_EQ(v, 0u);
    ASSERT_TRUE(ParseUInt64("18446744073709551615", v));
    ASSERT_EQ(v, UINT64_MAX);

    ASSERT_FALSE(ParseUInt64("", v));
    ASSERT_FALSE(ParseUInt64("-1", v));
    ASSERT_FALSE(ParseUInt64("+1", v));
    ASSERT_FALSE(ParseUInt64(" 1", v));
    ASSERT_FALSE(ParseUInt64("12x", v));
    ASSERT_FALSE(ParseUInt64("18446744073709551616", v));
}

TEST(IdgenTest, UsageErrors) {
    string out;
    ASSERT_EQ(::Run({}, &out), 1);
    ASSERT_NE(out.find("usage:"), string::npos);

    ASSERT_EQ(::Run({"bogus"}), 1);
    ASSERT_EQ(::Run({"gen", "abc"}), 1);
    ASSERT_EQ(::Run({"gen", "-5"}), 1);
    ASSERT_EQ(::Run({"gen", "5", "0"}), 1);
    ASSERT_EQ(::Run({"gen", "5", "x"}), 1);
    ASSERT_EQ(::Run({"gen", "1", "1", "extra"}), 1);
    ASSERT_EQ(::Run({"gen", "1", to_string(kMaxGenerateThreads + 1)}), 1);
    ASSERT_EQ(::Run({"decompose"}), 1);

    // 超过上限的数量不会去分配内存
    ASSERT_EQ(::Run({"gen", to_string(kMaxGenerateCount + 1)}, &out), 1);
    ASSERT_NE(out.find("usage:"), string::npos);
    ASSERT_EQ(::Run({"gen", "18446744073709551615"}), 1);
}

TEST(IdgenTest, DecomposeRejectsMalformedId) {
    ScopedEnv no_conf("TODEL_CONF", nullptr);
    string out;
    ASSERT_EQ(::Run({"decompose", "12x"}, &out), 1);
    ASSERT_TRUE(out.empty());

    // 有一个参数不合法时什么都不输出
    ASSERT_EQ(::Run({"decompose", "42", "-3"}, &out), 1);
    ASSERT_TRUE(out.empty());
    ASSERT_EQ(::Run({"decompose", "99999999999999999999"}, &out), 1);
}

TEST(IdgenTest, DecomposeFields) {
    ScopedEnv no_conf("TODEL_CONF", nullptr);
    uint64_t id = ComposeUID({1234, 5, 6});
    string out;
    ASSERT_EQ(::Run({"decompose", to_string(id), to_string(UINT64_MAX)}, &out), 0);

    auto lines = Lines(out);
    ASSERT_EQ(lines.size(), 2u);

    Json::Reader reader;
    Json::Value obj;
    ASSERT_TRUE(reader.parse(lines[0], obj));
    ASSERT_EQ(obj["id"].asUInt64(), id);
    ASSERT_EQ(obj["timestamp"].asUInt64(), 1234u);
    ASSERT_EQ(obj["unix_ms"].asUInt64(), kPlatformEpochMs + 1234);
    ASSERT_EQ(obj["worker_id"].asUInt(), 5u);
    ASSERT_EQ(obj["sequence"].asUInt(), 6u);

    ASSERT_TRUE(reader.parse(lines[1], obj));
    ASSERT_EQ(obj["id"].asUInt64(), UINT64_MAX);
    ASSERT_EQ(obj["timestamp"].asUInt64(), kTimestampMask);
    ASSERT_EQ(obj["worker_id"].asUInt(), 1023u);
    ASSERT_EQ(obj["sequence"].asUInt(), 4095u);
}

TEST(IdgenTest, DecomposeUsesConfiguredEpoch) {
    string path = WriteTempFile("todel_idgen_epoch.json",
                                R"({"instance_name": "IdgenTest", "ids": {"epoch_ms": 0}})");
    ScopedEnv conf_env("TODEL_CONF", path.c_str());

    string out;
    ASSERT_EQ(::Run({"decompose", to_string(ComposeUID({1234, 5, 6}))}, &out), 0);
    Json::Reader reader;
    Json::Value obj;
    ASSERT_TRUE(reader.parse(out, obj));
    ASSERT_EQ(obj["unix_ms"].asUInt64(), 1234u);
}

TEST(IdgenTest, GenerateDistinctIds) {
    string path = WriteTempFile("todel_idgen_gen.json",
                                R"({"instance_name": "IdgenTest", "log_level": "warn", "ids": {"worker_id": 21}})");
    ScopedEnv conf_env("TODEL_CONF", path.c_str());

    string out;
    ASSERT_EQ(::Run({"gen", "5000", "4"}, &out), 0);
    auto lines = Lines(out);
    ASSERT_EQ(lines.size(), 5000u);

    unordered_set<uint64_t> seen;
    for (auto& line : lines) {
        uint64_t id = 0;
        ASSERT_TRUE(ParseUInt64(line.c_str(), id)) << line;
        ASSERT_EQ(UIDGenerator::Decompose(id).worker_id, 21);
        ASSERT_TRUE(seen.insert(id).second);
    }

    // 默认生成一个
    ASSERT_EQ(::Run({"gen"}, &out), 0);
    ASSERT_EQ(Lines(out).size(), 1u);
    ASSERT_EQ(::Run({"gen", "0"}, &out), 0);
    ASSERT_TRUE(out.empty());
}

TEST(IdgenTest, GenerateRuntimeFailures) {
    {
        ScopedEnv conf_env("TODEL_CONF", (testing::TempDir() + "todel_idgen_missing.json").c_str());
        ASSERT_EQ(::Run({"gen", "3"}), 2);
    }
    {
        // worker id由环境变量给出但越界
        string path = WriteTempFile("todel_idgen_noid.json", R"({"instance_name": "IdgenTest", "log_level": "warn"})");
        ScopedEnv conf_env("TODEL_CONF", path.c_str());
        ScopedEnv worker_env("TODEL_WORKER_ID", "2048");
        string out;
        ASSERT_EQ(::Run({"gen", "3"}, &out), 2);
        ASSERT_TRUE(out.empty());
    }
}

TEST(IdgenTest, StalledClockExitsWithError) {
    auto clock = make_shared<ManualClock>(10);
    UIDGenerator gen(3, clock, 4);
    ostringstream out;
    ASSERT_EQ(GenerateIds(gen, 5000, 1, out), 2);
    // 同一毫秒内的4096个ID已经输出
    ASSERT_EQ(Lines(out.str()).size(), 4096u);
}

TEST(IdgenTest, UnexpectedExceptionInWorker) {
    // 非ClockRegression异常也必须在工作线程里被捕获，返回2而不是terminate
    auto clock = make_shared<FailingClock>(50);
    UIDGenerator gen(3, clock);
    ostringstream out;
    ASSERT_EQ(GenerateIds(gen, 1000, 4, out), 2);
    ASSERT_EQ(Lines(out.str()).size(), 49u);
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
