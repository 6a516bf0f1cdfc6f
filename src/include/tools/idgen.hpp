#ifndef TODEL_TOOLS_IDGEN_HEADER
#define TODEL_TOOLS_IDGEN_HEADER

// todel_idgen 命令行工具
//   todel_idgen gen [count] [threads]
//   todel_idgen decompose <id>...
// 返回值：0成功，1用法错误，2运行时异常

#include <cstdint>
#include <ostream>

#include "ids/snowflake_id.hpp"

namespace todel {
namespace tools {

// 单次gen最多生成的ID个数，超过按用法错误处理
constexpr uint64_t kMaxGenerateCount = 10'000'000;
// 线程数上限
constexpr uint64_t kMaxGenerateThreads = 256;

// @brief 解析非负十进制整数，格式错误或溢出返回false
bool ParseUInt64(const char* s, uint64_t& out);

void Usage(const char* prog, std::ostream& out);

// @brief 在threads个线程上用gen生成count个ID，按线程顺序写到out
// @return 0成功；任一线程抛出异常时返回2，已生成的ID仍会输出
int GenerateIds(UIDGenerator& gen, uint64_t count, uint64_t threads, std::ostream& out);

int RunGenerate(int argc, char** argv, std::ostream& out);
int RunDecompose(int argc, char** argv, std::ostream& out);

// @brief 命令分发，任何异常都转成返回值2
int RunIdgen(int argc, char** argv, std::ostream& out);

}  // namespace tools
}  // namespace todel

#endif
