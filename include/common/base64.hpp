#pragma once

#include <string>

namespace codejudge {

/**
 * @brief 将任意字节串编码为标准 base64（带 = 填充，不换行）
 */
std::string encode_base64(const std::string &data);

/**
 * @brief 解码标准 base64，忽略其中的换行和空白字符
 * @throw std::invalid_argument 若 text 不是合法的 base64
 */
std::string decode_base64(const std::string &text);

}  // namespace codejudge
