#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace grader {

/**
 * @brief 比较输出前对文本进行的规范化处理
 * filter 必须是纯函数，同一个 filter 会分别作用在选手输出和标准输出上。
 */
struct filter {
    virtual ~filter();

    /**
     * @brief filter 的名称，config.yml 中通过这个名称引用 filter
     */
    virtual std::string name() const = 0;

    /**
     * @brief 对文本进行规范化
     */
    virtual std::string apply(const std::string &text) const = 0;
};

typedef std::shared_ptr<const filter> filter_ptr;

/**
 * @brief 由一个函数实现的 filter
 */
struct function_filter : public filter {
    function_filter(const std::string &name, std::function<std::string(const std::string &)> fn);

    std::string name() const override;

    std::string apply(const std::string &text) const override;

private:
    std::string filter_name;
    std::function<std::string(const std::string &)> fn;
};

/**
 * @brief 注册一个 filter，名称不区分大小写，同名的 filter 会被替换
 * 内置的 filter 有：
 * 1. rstrip: 删除每行行末的空白字符以及文末的空行
 * 2. trim: 删除全文首尾的空白字符
 * 3. lower: 将 ASCII 字母转换为小写
 * 4. squeeze: 将连续的空格和制表符合并为一个空格
 * 5. nonempty: 删除所有空行
 * 6. unix: 将 CRLF 换行转换为 LF
 */
void register_filter(filter_ptr f);

/**
 * @brief 根据名称查找 filter，名称不区分大小写
 * @throw config_error 若不存在该 filter
 */
filter_ptr find_filter(const std::string &name);

/**
 * @brief 依次应用 filters
 */
std::string apply_filters(const std::string &text, const std::vector<filter_ptr> &filters);

/**
 * @brief 分别对 actual 和 expected 依次应用 filters 后比较是否完全相同
 * filters 为空时为逐字节比较
 */
bool compare(const std::string &actual, const std::string &expected, const std::vector<filter_ptr> &filters);

}  // namespace grader
