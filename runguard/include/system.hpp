#pragma once

#include <string>

/**
 * @brief 解析用户，可以是用户名也可以是数字形式的用户 id
 * @throw std::runtime_error 当用户不存在时
 */
int resolve_user(const std::string &user);

/**
 * @brief 解析用户组，可以是组名也可以是数字形式的组 id
 * @throw std::runtime_error 当用户组不存在时
 */
int resolve_group(const std::string &group);
