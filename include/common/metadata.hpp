#pragma once

#include <filesystem>
#include <map>
#include <string>

namespace grader {

/**
 * @brief 读入并解析 isolate 产生的 metadata 文件
 * metadata 文件每行为 key:value，比如 time-wall:0.103。
 * 返回结果中 key 的连字符会被删除（time-wall 变成 timewall），
 * key 和 value 两端的空白字符会被删除，没有冒号的行会被忽略。
 * @return metadata 文件的解析结果，文件不存在时返回空表
 */
std::map<std::string, std::string> read_metadata(const std::filesystem::path &metadata_file);

}  // namespace grader
