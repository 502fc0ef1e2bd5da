#pragma once

// Chinese string table - included by i18n.hpp after Strings is defined

inline constexpr Strings ZH_STRINGS_DEF = {
    // General
    "chi-watchdog",
    "任务",
    "未配置任务",
    "选择任务并按回车",
    "（无输出）",

    // Job state
    "运行中",
    "已停止",
    "外部进程：运行中",
    "外部进程：未运行",

    // Watchdog panel
    "正在重启...",
    "外部模式：不支持重启",
    "已启动",
    "已请求停止",
    "已执行外部终止命令",
    "外部模式：未配置终止命令",
    "已恢复自动跟随",
    "跟随",
    "暂停",

    // Footer
    "重启",
    "启动/停止",
    "终止",
    "跟随",
    "窗格",
    "语言",
    "退出",

    // Errors
    "配置无效",
    "找不到配置文件",
};
