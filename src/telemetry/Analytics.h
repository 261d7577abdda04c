#pragma once
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief 遥测事件接口 (发出即忘)
 *
 * track 不阻塞调用方, 可被多个线程同时调用。
 * close 只由 Supervisor 在关闭阶段调用一次: 阻塞直到之前提交的
 * 事件全部送出或超时。close 之后的 track 被静默丢弃。
 */
class Analytics {
public:
    virtual ~Analytics() = default;

    virtual void track(const std::string& event, const nlohmann::json& properties) = 0;

    virtual void close() = 0;
};
