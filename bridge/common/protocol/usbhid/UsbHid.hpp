#pragma once

/**
 * @brief KNX USB HID 报文编解码
 *
 * 包含:
 * - UsbHid.Types.hpp   - 常量、枚举、报文结构、解码结果
 * - UsbHid.Utils.hpp   - 大端读写、半字节打包、枚举映射表、HEX
 * - UsbHid.Builder.hpp - 报文构建（encode）
 * - UsbHid.Parser.hpp  - 报文解析（decode / extractPayload）
 */

#include "UsbHid.Types.hpp"
#include "UsbHid.Utils.hpp"
#include "UsbHid.Builder.hpp"
#include "UsbHid.Parser.hpp"
