#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace codejudge {

/**
 * @brief 选手程序编译及运行的根目录
 * 每个提交在该目录下拥有一个随机 uuid 命名的临时文件夹，评测结束后删除。
 * 若将这个文件夹放进内存盘，可以加速选手程序的 IO 性能。
 *
 * RUN_DIR
 * ├── 0b6f5c1e-... // 随机生成的 uuid，挂载为沙箱内的 /app，选手程序不可写
 * │   ├── program // 选手程序的工作目录，选手程序可写
 * │   │   ├── solution.cpp // 选手程序的代码（文件名由语言决定）
 * │   │   └── a.out // 编译产物
 * │   ├── run_script.sh // 生成的驱动脚本
 * │   ├── tests // 仅驱动脚本可以访问
 * │   │   ├── 1.in // 第 1 个测试点的输入
 * │   │   └── ...
 * │   ├── compile.log // 编译器的输出（驱动脚本产生）
 * │   ├── input.txt // 当前测试点的输入（驱动脚本产生）
 * │   ├── output.txt // 当前测试点选手程序的 stdout（驱动脚本产生）
 * │   └── stderr.txt // 当前测试点选手程序的 stderr（驱动脚本产生）
 * └── ...
 * @defaultValue 系统临时文件夹
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief docker 客户端的路径，默认从 PATH 中查找
 */
extern std::string DOCKER_EXECUTABLE;

/**
 * @brief 沙箱内最多允许的进程数，和提交无关，用于防止 fork 炸弹
 */
extern int SANDBOX_PROC_LIMIT;

/**
 * @brief 沙箱内每个进程最多允许打开的文件描述符数量
 */
extern int SANDBOX_FILE_LIMIT;

/**
 * @brief 沙箱可以使用的 CPU 核心数量
 */
extern std::string SANDBOX_CPUS;

/**
 * @brief 编译和运行选手程序时使用的用户，格式为 uid:gid
 * 驱动脚本以 root 身份运行，通过 setpriv 切换到该用户后再执行编译命令和选手程序，
 * 使选手程序无法访问驱动脚本的 stdout 和测试数据。
 * 为空时不切换用户，此时选手程序与驱动脚本处于同一用户下，仅用于测试。
 */
extern std::string SANDBOX_USER;

/**
 * @brief 看门狗给编译预留的时间，单位为秒
 * 看门狗时间 = 时间限制 * 测试点数量 + COMPILE_TIME_ALLOWANCE
 */
extern int COMPILE_TIME_ALLOWANCE;

/**
 * @brief 驱动脚本中选手程序 stdout、stderr 以及编译器输出各自保留的最大字节数
 */
extern size_t OUTPUT_LIMIT;

/**
 * @brief 从沙箱捕获的 stdout、stderr 各自保留的最大字节数
 */
extern size_t CAPTURE_LIMIT;

/**
 * @brief 远程评测服务的地址
 */
extern std::string RUNNER_URL;

/**
 * @brief 远程评测服务单次请求的超时时间，单位为秒
 */
extern int REMOTE_TIMEOUT;

}  // namespace codejudge
