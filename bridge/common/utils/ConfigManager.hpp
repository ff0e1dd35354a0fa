#pragma once

#include "Constants.hpp"
#include "common/protocol/usbhid/UsbHid.Types.hpp"

#include <json/json.h>
#include <trantor/utils/Logger.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief 配置管理器 - 负责加载、验证和管理桥接程序配置
 *
 * 启动时检查配置文件的完整性和正确性：
 * - JSON 语法检查
 * - 必填字段检查（device.path、handler.type）
 * - read_size 范围、handler 类型、日志级别合法性校验
 * - 可疑值警告（设备路径不在 /dev 下、read_size 放不下一个报告头）
 */
class ConfigManager {
public:
    /**
     * @brief 加载并验证配置文件
     * @param explicitPath 命令行指定的路径，为空时按默认位置查找
     * @return 是否成功加载，失败时已输出详细错误信息到 stderr 和日志
     */
    static bool load(const std::optional<std::string>& explicitPath = std::nullopt) {
        // 每次加载前重置，避免读取失败时沿用旧值
        config_ = Json::Value(Json::objectValue);
        lastErrors_.clear();

        // 1. 查找配置文件
        auto configPath = explicitPath ? checkExplicitPath(*explicitPath) : findConfigFile();
        if (!configPath) {
            return false;
        }

        // 2. 解析 JSON
        Json::Value root;
        if (!parseConfigFile(*configPath, root)) {
            return false;
        }

        // 3. 验证并应用
        if (!loadFromValue(root, *configPath)) {
            return false;
        }

        LOG_INFO << "Config loaded from: " << *configPath;
        return true;
    }

    /**
     * @brief 验证并应用已解析的配置
     * @param source 用于错误提示的来源名称
     */
    static bool loadFromValue(const Json::Value& root, const std::string& source) {
        config_ = Json::Value(Json::objectValue);
        lastErrors_.clear();

        if (!root.isObject()) {
            printErrors("JSON 格式错误: " + source, {"配置文件根节点必须是 JSON 对象"});
            return false;
        }

        if (!validateConfig(root, source)) {
            return false;
        }

        config_ = root;
        return true;
    }

    /** 最近一次加载失败的错误列表（测试 / 诊断用） */
    static const std::vector<std::string>& lastErrors() {
        return lastErrors_;
    }

    static std::string getLogLevel() {
        return config_.get("log_level", "INFO").asString();
    }

    static bool isConsoleLogEnabled() {
        return config_.get("console_log", false).asBool();
    }

    static std::string getLogDir() {
        return config_.get("log_dir", Constants::DEFAULT_LOG_DIR).asString();
    }

    static std::string getDevicePath() {
        return section("device").get("path", "").asString();
    }

    static size_t getReadSize() {
        return static_cast<size_t>(
            section("device").get("read_size", static_cast<Json::UInt>(Constants::DEFAULT_READ_SIZE)).asUInt());
    }

    /** 连接名称（日志标识），默认 "knx" */
    static std::string getConnectionName() {
        return section("device").get("name", "knx").asString();
    }

    static std::string getHandlerType() {
        return section("handler").get("type", Constants::HANDLER_LISTENER).asString();
    }

    /** handler.options 原样传给 Handler::init */
    static Json::Value getHandlerOptions() {
        const auto& handler = section("handler");
        if (handler.isMember("options") && handler["options"].isObject()) {
            return handler["options"];
        }
        return Json::Value(Json::objectValue);
    }

private:
    inline static Json::Value config_{Json::objectValue};
    inline static std::vector<std::string> lastErrors_;

    /** 只读访问配置节，缺失时返回 null */
    static const Json::Value& section(const char* name) {
        const Json::Value& root = config_;
        return root[name];
    }

    // ─── 配置文件查找 ───────────────────────────────────────────

    static std::optional<std::string> findConfigFile() {
        static const std::vector<std::string> paths = {
            "./config/config.local.json",
            "../config/config.local.json",
            "./config/config.json",
            "../config/config.json",
            "config.json"
        };

        for (const auto& path : paths) {
            if (fs::exists(path)) {
                return path;
            }
        }

        std::vector<std::string> hints = {"请在以下位置之一创建配置文件:"};
        for (const auto& p : paths) {
            hints.push_back("  - " + p);
        }
        hints.emplace_back("可参考 config/config.example.json");
        printErrors("未找到配置文件", hints);
        return std::nullopt;
    }

    static std::optional<std::string> checkExplicitPath(const std::string& path) {
        if (!fs::exists(path)) {
            printErrors("配置文件不存在: " + path, {"请检查 --config 参数"});
            return std::nullopt;
        }
        return path;
    }

    // ─── JSON 解析 ──────────────────────────────────────────────

    static bool parseConfigFile(const std::string& path, Json::Value& root) {
        std::ifstream ifs(path);
        if (!ifs) {
            printErrors("无法打开配置文件: " + path, {"请检查文件是否存在及读取权限"});
            return false;
        }

        Json::CharReaderBuilder builder;
        std::string errs;
        if (!Json::parseFromStream(builder, ifs, &root, &errs)) {
            printErrors("JSON 解析失败: " + path, {
                errs,
                "请检查 JSON 语法（缺少逗号、引号不匹配、尾部逗号等）"
            });
            return false;
        }

        return true;
    }

    // ─── 配置验证 ──────────────────────────────────────────────

    static bool validateConfig(const Json::Value& root, const std::string& path) {
        std::vector<std::string> errors;
        std::vector<std::string> warnings;

        validateLogging(root, errors);
        validateDevice(root, errors, warnings);
        validateHandler(root, errors);

        if (!warnings.empty()) {
            printWarnings("配置警告 (" + path + ")", warnings);
        }

        if (!errors.empty()) {
            printErrors("配置验证失败: " + path, errors);
            return false;
        }

        return true;
    }

    static void validateLogging(const Json::Value& root, std::vector<std::string>& errors) {
        if (root.isMember("log_level")) {
            static const std::vector<std::string> levels = {
                "TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL"
            };
            const auto& level = root["log_level"];
            if (!level.isString() ||
                std::find(levels.begin(), levels.end(), level.asString()) == levels.end()) {
                errors.emplace_back("[log_level] 无效，可选: TRACE/DEBUG/INFO/WARN/ERROR/FATAL");
            }
        }
        if (root.isMember("console_log") && !root["console_log"].isBool()) {
            errors.emplace_back("[console_log] 必须是 true/false");
        }
        if (root.isMember("log_dir") &&
            (!root["log_dir"].isString() || root["log_dir"].asString().empty())) {
            errors.emplace_back("[log_dir] 必须是非空字符串");
        }
    }

    static void validateDevice(const Json::Value& root,
                               std::vector<std::string>& errors,
                               std::vector<std::string>& warnings) {
        if (!root.isMember("device") || !root["device"].isObject()) {
            errors.emplace_back("[device] 缺少设备配置");
            return;
        }

        const auto& device = root["device"];
        if (!device.isMember("path") || !device["path"].isString() ||
            device["path"].asString().empty()) {
            errors.emplace_back("[device] 缺少 path 字段（如 /dev/hidraw0）");
        } else if (!device["path"].asString().starts_with("/dev/")) {
            warnings.push_back("[device] path 不在 /dev 下: " + device["path"].asString());
        }

        if (device.isMember("read_size")) {
            const auto& rs = device["read_size"];
            if (!rs.isIntegral()) {
                errors.emplace_back("[device] read_size 必须是整数");
            } else {
                auto size = rs.asInt64();
                if (size < 1 || size > static_cast<int64_t>(Constants::MAX_READ_SIZE)) {
                    errors.push_back("[device] read_size 值无效: " + std::to_string(size) +
                        "（有效范围: 1-" + std::to_string(Constants::MAX_READ_SIZE) + "）");
                } else if (size < static_cast<int64_t>(usbhid::ProtocolConst::FRAMING_OVERHEAD)) {
                    warnings.push_back("[device] read_size 过小（" + std::to_string(size) +
                        "），放不下一个完整报告头，所有报告都会解码失败");
                }
            }
        }

        if (device.isMember("name") &&
            (!device["name"].isString() || device["name"].asString().empty())) {
            errors.emplace_back("[device] name 必须是非空字符串");
        }
    }

    static void validateHandler(const Json::Value& root, std::vector<std::string>& errors) {
        if (!root.isMember("handler") || !root["handler"].isObject()) {
            errors.emplace_back("[handler] 缺少 Handler 配置");
            return;
        }

        const auto& handler = root["handler"];
        if (!handler.isMember("type") || !handler["type"].isString()) {
            errors.emplace_back("[handler] 缺少 type 字段");
        } else {
            const auto type = handler["type"].asString();
            if (type != Constants::HANDLER_LISTENER && type != Constants::HANDLER_ECHO) {
                errors.push_back("[handler] type 值无效: " + type + "（可选: listener/echo）");
            }
        }

        if (handler.isMember("options") && !handler["options"].isObject()) {
            errors.emplace_back("[handler] options 必须是 JSON 对象");
        }
    }

    // ─── 工具方法 ──────────────────────────────────────────────

    static void printErrors(const std::string& title, const std::vector<std::string>& messages) {
        lastErrors_.insert(lastErrors_.end(), messages.begin(), messages.end());

        std::string border(60, '=');
        std::cerr << "\n" << border << "\n";
        std::cerr << " [ERROR] " << title << "\n";
        std::cerr << std::string(60, '-') << "\n";
        for (const auto& msg : messages) {
            std::cerr << "  " << msg << "\n";
            LOG_ERROR << "[Config] " << msg;
        }
        std::cerr << border << "\n" << std::endl;
    }

    static void printWarnings(const std::string& title, const std::vector<std::string>& messages) {
        std::cerr << "\n" << std::string(60, '-') << "\n";
        std::cerr << " [WARN] " << title << "\n";
        for (const auto& msg : messages) {
            std::cerr << "  " << msg << "\n";
            LOG_WARN << "[Config] " << msg;
        }
        std::cerr << std::string(60, '-') << "\n" << std::endl;
    }
};
