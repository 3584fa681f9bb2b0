#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace hackjudge {

/**
 * @brief 评测引擎所有异常的基类，构造时记录调用栈以便运维排查
 */
struct engine_exception : std::exception {
    engine_exception();
    explicit engine_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const engine_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测引擎的基础设施错误
 * 基础设施错误不是选手的责任，编排器会有限次数地重试，仍然失败时任务以 infrastructure 类别失败
 */
struct infrastructure_error : public engine_exception {
    using engine_exception::engine_exception;
};

/**
 * @brief 沙箱无法使用
 * 比如 runguard 不存在、runguard 报告了 internal-error、严格模式下无法隔离
 */
struct sandbox_unavailable : public infrastructure_error {
    using infrastructure_error::infrastructure_error;
};

/**
 * @brief 结果存储不可用
 */
struct store_error : public infrastructure_error {
    using infrastructure_error::infrastructure_error;
};

/**
 * @brief 工作区无法创建或复制，通常是磁盘空间耗尽
 */
struct workspace_error : public infrastructure_error {
    using infrastructure_error::infrastructure_error;
};

/**
 * @brief 任务被取消，由沙箱在受控程序因取消而被终止时抛出
 */
struct evaluation_cancelled : public engine_exception {
    using engine_exception::engine_exception;
};

/**
 * @brief 配置文件不合法，只会在启动时抛出
 */
struct config_error : public engine_exception {
    using engine_exception::engine_exception;
};

}  // namespace hackjudge
