#pragma once

#include <filesystem>
#include <string>

namespace grader {

/**
 * @brief 一次执行独占的临时目录
 * 
 * RUN_DIR
 * └── run-[uuid] // 本次执行的根目录，对选手程序不可见
 *     ├── workspace // 选手代码、测试代码、报告插件，对选手程序只读
 *     ├── scratch // 选手程序唯一可写的目录，测试报告写在这里
 *     ├── stdin.txt // 标准输入数据
 *     ├── program.out // 选手程序的 stdout
 *     ├── program.err // 选手程序的 stderr
 *     ├── program.meta // runguard 写入的运行信息
 *     └── runguard.log // runguard 本身的日志
 * 
 * 析构时删除整个目录，除非开启了 DEBUG 模式
 */
class workspace {
public:
    /**
     * @param run_dir 所有执行的公共根目录，不存在时会被创建
     * @param keep 为真时析构不删除目录
     * @throw internal_error 当目录无法创建时
     */
    workspace(const std::filesystem::path &run_dir, bool keep);
    ~workspace();

    workspace(const workspace &) = delete;
    workspace &operator=(const workspace &) = delete;

    const std::filesystem::path &root() const;
    std::filesystem::path files() const;
    std::filesystem::path scratch() const;

    /**
     * @brief 在 workspace 文件夹中写入一个输入文件
     * @param name 相对文件名，不允许包含 ".." 或者是绝对路径
     * @throw internal_error 当文件名不安全或写入失败时
     */
    void write_file(const std::string &name, const std::string &content);

private:
    std::filesystem::path dir;
    bool keep;
};

}  // namespace grader
