#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace hackjudge {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 读取文件的前 limit 个字节，用于保存有大小上限的程序输出
 * @param truncated 若不为空，保存文件是否比 limit 长
 */
std::string read_file_prefix(const std::filesystem::path &path, size_t limit, bool *truncated = nullptr);

/**
 * @brief 原子地写入文件：先写入同目录下的临时文件，再重命名覆盖目标文件
 * 读者要么看到旧的内容，要么看到完整的新内容
 * @throw std::system_error 若写入失败
 */
void write_file_atomically(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 这里用于确保计算目录时不会出现目录遍历攻击，配置文件或选手仓库中
 * 的文件名如果包含 "../"，那么有可能导致工作区外的文件被覆盖。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 统计文件夹内所有普通文件的大小之和（不跟随符号链接）
 * 统计过程中消失的文件不计入，文件夹不存在时返回 0
 */
uintmax_t directory_size(const std::filesystem::path &dir);

/**
 * @brief 递归去掉文件夹内所有文件的写权限
 */
void make_read_only(const std::filesystem::path &dir);

/**
 * @brief 递归复制文件夹，并为复制结果加上所有者的写权限
 * 用于从只读的快照复制出可写的构建目录和运行目录
 */
void copy_directory(const std::filesystem::path &from, const std::filesystem::path &to);

/**
 * @brief 递归删除文件夹，会先恢复写权限以便删除只读的快照
 */
void remove_directory(const std::filesystem::path &dir);

}  // namespace hackjudge
