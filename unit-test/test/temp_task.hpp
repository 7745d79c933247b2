#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <filesystem>
#include <string>
#include "common/io_utils.hpp"

/**
 * @brief 测试用的题目目录，析构时删除
 */
class temp_task {
public:
    std::filesystem::path path;

    temp_task()
        : path(std::filesystem::temp_directory_path() /
               ("grader-task-" + boost::lexical_cast<std::string>(boost::uuids::random_generator()()))) {
        std::filesystem::create_directories(path);
    }

    ~temp_task() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    temp_task(const temp_task &) = delete;
    temp_task &operator=(const temp_task &) = delete;

    temp_task &add(const std::string &name, const std::string &content) {
        std::filesystem::path file = path / name;
        std::filesystem::create_directories(file.parent_path());
        grader::write_file_content(file, content);
        return *this;
    }
};
