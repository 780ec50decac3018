// @file DecodeError.cppm
// @brief デコードエラーの例外型と入力位置の定義。

module;
#include <cstddef>
#include <cstdio>
#include <stdexcept>
#include <string>

export module rai.jsonstream.decode_error;

export namespace rai::jsonstream {

/// @brief 入力テキスト上の位置（1始まり）。
/// @note 区切り文字の読み飛ばし中にのみ更新されるため、文字列・数値の内部では直前の区切り位置を指す。
struct TextPosition {
    std::size_t line{1};    ///< 行番号
    std::size_t column{1};  ///< 桁番号

    bool operator==(const TextPosition&) const = default;
};

/// @brief 不正な入力や途中終端を表す例外。
/// @note 発生したデコーダーはそれ以降使用できない。
class DecodeError : public std::runtime_error {
public:
    /// @brief コンストラクタ。
    /// @param position エラー発生時の入力位置。
    /// @param detail エラー内容。
    DecodeError(TextPosition position, const std::string& detail)
        : std::runtime_error("scan error on line " + std::to_string(position.line) +
                             " at column " + std::to_string(position.column) + ": " + detail),
          position_(position) {}

    std::size_t line() const { return position_.line; }
    std::size_t column() const { return position_.column; }
    TextPosition position() const { return position_; }

private:
    TextPosition position_;  ///< エラー発生時の入力位置
};

/// @brief 次のトークンが文字列でないのに文字列リーダーを要求した場合の例外。
/// @note 入力は消費されないため、捕捉後にnextToken()で読み進められる。
class NotStringError : public std::runtime_error {
public:
    NotStringError() : std::runtime_error("token is not a string value") {}
};

/// @brief バイト値をエラーメッセージ用の"0x%02x"形式に変換する。
/// @param c 対象のバイト。
/// @return 変換した文字列。
std::string describeByte(char c) {
    char text[8];
    std::snprintf(text, sizeof(text), "0x%02x", static_cast<unsigned char>(c));
    return text;
}

}  // namespace rai::jsonstream
