// @file JsonToken.cppm
// @brief JSONトークンの定義。

module;
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>

export module rai.jsonstream.json_token;

import rai.jsonstream.decode_error;

export namespace rai::jsonstream {

// ******************************************************************************** トークン型定義（内部実装詳細）
namespace json_token_detail {

// @brief 入力ストリーム終端を示すタグ
struct EndOfStreamTag {
    bool operator==(const EndOfStreamTag&) const = default;
};

// @brief null値を示すタグ
struct NullTag {
    bool operator==(const NullTag&) const = default;
};

// @brief 真偽値を保持する型
struct BoolVal {
    bool v{};
    bool operator==(const BoolVal&) const = default;
};

// @brief 整数値を保持する型
struct IntVal {
    std::int64_t v{};
    bool operator==(const IntVal&) const = default;
};

// @brief 浮動小数点数値を保持する型
struct NumVal {
    double v{};
    bool operator==(const NumVal&) const = default;
};

// @brief 文字列値を保持する型
using StrVal = std::string;

// @brief 区切り記号（'{' '}' '[' ']'のいずれか）を保持する型
struct DelimVal {
    char v{};
    bool operator==(const DelimVal&) const = default;
};

}  // namespace json_token_detail

// @brief JSONトークンの種類を表す列挙型
enum class JsonTokenType {
    EndOfStream,    ///< 入力ストリーム終端
    Null,           ///< null値
    Bool,           ///< 真偽値
    Integer,        ///< 整数値
    Number,         ///< 浮動小数点数値
    String,         ///< 文字列値
    Delimiter       ///< オブジェクト・配列の開始と終了
};

// @brief JSONトークンのvariant表現
// @note 内部実装の詳細型はjson_token_detail名前空間に隠蔽されている
using JsonTokenValue =
    std::variant<json_token_detail::EndOfStreamTag, json_token_detail::NullTag,
                 json_token_detail::BoolVal, json_token_detail::IntVal, json_token_detail::NumVal,
                 json_token_detail::StrVal, json_token_detail::DelimVal>;

// @brief JSONトークン（値と入力位置を保持）
struct JsonToken {
    JsonTokenValue value{};    ///< トークンの種類と値
    TextPosition position{};   ///< トークン先頭の入力位置

    JsonToken() = default;
    JsonToken(const JsonToken&) = default;
    JsonToken(JsonToken&&) = default;
    JsonToken& operator=(const JsonToken&) = default;
    JsonToken& operator=(JsonToken&&) = default;

    JsonToken(JsonTokenValue v, TextPosition pos)
        : value(std::move(v)), position(pos) {}

    template <typename T>
    JsonToken(T&& v, TextPosition pos)
        : value(std::forward<T>(v)), position(pos) {}

    /// @brief トークンの種類を返す。
    // JsonTokenValueとJsonTokenTypeの列挙値の順序が一致していることを前提とする
    JsonTokenType type() const { return static_cast<JsonTokenType>(value.index()); }

    bool isEndOfStream() const { return type() == JsonTokenType::EndOfStream; }
};

}  // namespace rai::jsonstream
