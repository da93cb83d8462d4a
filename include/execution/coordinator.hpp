#pragma once

#include "config.hpp"
#include "execution/request.hpp"
#include "sandbox/cancellation.hpp"
#include "sandbox/sandbox.hpp"
#include "validate/security_gate.hpp"

namespace grader {

/**
 * @brief 单个请求的执行流程
 * 安全检查 -> 生成测试代码 -> 沙箱执行 -> 解析测试结果。
 * 被安全检查拒绝的请求不会进入沙箱。
 */
class execution_coordinator {
public:
    /**
     * @param config 配置，生命周期必须长于 coordinator
     * @param box 沙箱，生命周期必须长于 coordinator
     * @throw config_error 当拒绝规则中的正则表达式不合法时
     */
    execution_coordinator(const grader_config &config, grader::sandbox &box);

    /**
     * @brief 执行请求，不会抛出异常
     * @param cancel 可以为空，取消后正在运行的执行单元会被销毁，结果为超时
     */
    execution_response execute(const execution_request &request, const cancellation_token *cancel = nullptr) const noexcept;

    /**
     * @brief 计算请求实际使用的资源限制
     * 请求中的覆盖值不能超过配置的上限，不合法（非正数）时使用默认值
     */
    sandbox_limits limits_for(const execution_request &request) const;

    const security_gate &gate() const;

private:
    sandbox_task make_task(const execution_request &request) const;

    const grader_config &config;
    grader::sandbox &box;
    security_gate checker;
};

}  // namespace grader
