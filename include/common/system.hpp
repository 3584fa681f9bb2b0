#pragma once

#include <sys/types.h>
#include <filesystem>
#include <string>

namespace hackjudge {

/**
 * @brief 根据用户名或数字形式的用户 id 查找用户
 * @return 用户 id，找不到时返回 -1
 */
int get_userid(const std::string &name);

/**
 * @brief 根据组名或数字形式的组 id 查找用户组
 * @return 组 id，找不到时返回 -1
 */
int get_groupid(const std::string &name);

/**
 * @brief 递归修改目录及其内容的所有者，符号链接本身被修改而不跟随
 * @throw std::filesystem::filesystem_error
 */
void change_owner(const std::filesystem::path &dir, uid_t uid, gid_t gid);

}  // namespace hackjudge
