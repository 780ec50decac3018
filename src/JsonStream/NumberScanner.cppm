// @file NumberScanner.cppm
// @brief 固定長のスクラッチバッファで数値リテラルを読み取り、整数または浮動小数点数に変換する。

module;
#include <array>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>

export module rai.jsonstream.number_scanner;

import rai.jsonstream.byte_source;
import rai.jsonstream.byte_cursor;
import rai.jsonstream.decode_error;
import rai.jsonstream.json_token;

export namespace rai::jsonstream {

/// @brief 数値リテラルの最大長(byte)。これを超えるリテラルはエラー。
constexpr std::size_t numberScratchCapacity = 64;

/// @brief 数値リテラルを構成しうる文字かどうかを判定する。
/// @note '+'は含まない。
constexpr bool isNumberChar(char c) {
    switch (c) {
        case '0': case '1': case '2': case '3': case '4':
        case '5': case '6': case '7': case '8': case '9':
        case '-': case '.': case 'e': case 'E':
            return true;
        default:
            return false;
    }
}

/// @brief from_charsの変換失敗理由をメッセージにする。
/// @param ec from_charsの戻り値のエラーコード。
/// @param consumedAll 全文字を消費したかどうか。
std::string describeConversionFailure(std::errc ec, bool consumedAll) {
    if (ec == std::errc::result_out_of_range) {
        return "value out of range";
    }
    if (ec != std::errc{} || !consumedAll) {
        return "invalid syntax";
    }
    return "unknown error";
}

// ******************************************************************************** NumberScanner
/// @brief 数値リテラルを読み取る。
/// @tparam Source 入力元の型。
template <ByteSource Source>
class NumberScanner {
public:
    /// @brief コンストラクタ。
    /// @param cursor 読み取り元のカーソル。
    explicit NumberScanner(ByteCursor<Source>& cursor) : cursor_(cursor), size_(0), isFloat_(false) {}

    /// @brief 数値リテラルを読み取り、トークン値に変換する。
    /// @return 整数ならIntVal、'.' 'e' 'E'を含めばNumVal。
    /// @note 数値を構成しない文字は押し戻し、次のトークンがそこから始まるようにする。
    JsonTokenValue scan() {
        for (;;) {
            auto input = cursor_.next();
            if (!input) {
                break;
            }
            char c = *input;
            if (!isNumberChar(c)) {
                cursor_.unread(c);
                break;
            }
            if (c == '.' || c == 'e' || c == 'E') {
                isFloat_ = true;
            }
            if (size_ == scratch_.size()) {
                throw DecodeError(cursor_.position(), "number is too long");
            }
            scratch_[size_++] = c;
        }

        return isFloat_ ? convertFloat() : convertInt();
    }

private:
    JsonTokenValue convertInt() const {
        std::int64_t value = 0;
        const char* last = scratch_.data() + size_;
        auto [ptr, ec] = std::from_chars(scratch_.data(), last, value, 10);
        if (ec != std::errc{} || ptr != last) {
            throw DecodeError(cursor_.position(),
                "failed to scan int: " + describeConversionFailure(ec, ptr == last) +
                " in '" + text() + "'");
        }
        return json_token_detail::IntVal{value};
    }

    JsonTokenValue convertFloat() const {
        double value = 0.0;
        const char* last = scratch_.data() + size_;
        auto [ptr, ec] = std::from_chars(scratch_.data(), last, value);
        if (ec == std::errc::result_out_of_range && ptr == last && hasNegativeExponent()) {
            // 表現できないほど小さい値は符号付きの0に丸める。
            return json_token_detail::NumVal{scratch_[0] == '-' ? -0.0 : 0.0};
        }
        if (ec != std::errc{} || ptr != last) {
            throw DecodeError(cursor_.position(),
                "failed to scan float: " + describeConversionFailure(ec, ptr == last) +
                " in '" + text() + "'");
        }
        return json_token_detail::NumVal{value};
    }

    bool hasNegativeExponent() const {
        for (std::size_t i = 0; i + 1 < size_; ++i) {
            if ((scratch_[i] == 'e' || scratch_[i] == 'E') && scratch_[i + 1] == '-') {
                return true;
            }
        }
        return false;
    }

    std::string text() const { return std::string(scratch_.data(), size_); }

    ByteCursor<Source>& cursor_;                           ///< 読み取り元のカーソル
    std::array<char, numberScratchCapacity> scratch_{};    ///< 読み取った数値リテラル
    std::size_t size_;                                     ///< scratch_の有効長
    bool isFloat_;                                         ///< 浮動小数点数として変換するならtrue
};

}  // namespace rai::jsonstream
