#pragma once

#include <string>

bool is_number(const std::string &s);

/**
 * @return 用户名对应的 uid，用户不存在时返回 -1
 */
int get_userid(const char *name);

/**
 * @return 用户组名对应的 gid，用户组不存在时返回 -1
 */
int get_groupid(const char *name);
