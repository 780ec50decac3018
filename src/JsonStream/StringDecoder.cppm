// @file StringDecoder.cppm
// @brief エスケープ済み文字列本体を1バイトずつ復号する状態機械と、それを逐次読み出す文字列リーダー。

module;
#include <array>
#include <cstddef>
#include <optional>
#include <string>

export module rai.jsonstream.string_decoder;

import rai.jsonstream.byte_source;
import rai.jsonstream.byte_cursor;
import rai.jsonstream.decode_error;

export namespace rai::jsonstream {

// @brief 文字列復号の状態
enum class StringDecoderState {
    Default,                ///< 通常文字
    Escape,                 ///< '\'の直後
    UnicodeHex,             ///< \uXXXXの16進数4桁を読み取り中
    SurrogateContinuation   ///< 上位サロゲートの後、"\u"を待っている
};

/// @brief UTF-16サロゲートの範囲判定。
constexpr bool isHighSurrogate(char32_t u) { return 0xD800 <= u && u <= 0xDBFF; }
constexpr bool isLowSurrogate(char32_t u) { return 0xDC00 <= u && u <= 0xDFFF; }

/// @brief Unicodeコードポイントを UTF-8 にエンコードする。
/// @param codePoint Unicodeコードポイント。サロゲートは U+FFFD に置き換える。
/// @param out 書き込み先（4バイト）。
/// @return 書き込んだバイト数。
std::size_t encodeUtf8(char32_t codePoint, std::array<char, 4>& out) {
    if (isHighSurrogate(codePoint) || isLowSurrogate(codePoint) || codePoint > 0x10FFFF) {
        codePoint = 0xFFFD;
    }
    if (codePoint <= 0x7F) {
        // 1バイト (ASCII)
        out[0] = static_cast<char>(codePoint);
        return 1;
    } else if (codePoint <= 0x7FF) {
        // 2バイト
        out[0] = static_cast<char>(0xC0 | ((codePoint >> 6) & 0x1F));
        out[1] = static_cast<char>(0x80 | (codePoint & 0x3F));
        return 2;
    } else if (codePoint <= 0xFFFF) {
        // 3バイト
        out[0] = static_cast<char>(0xE0 | ((codePoint >> 12) & 0x0F));
        out[1] = static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
        out[2] = static_cast<char>(0x80 | (codePoint & 0x3F));
        return 3;
    }
    // 4バイト
    out[0] = static_cast<char>(0xF0 | ((codePoint >> 18) & 0x07));
    out[1] = static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F));
    out[2] = static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
    out[3] = static_cast<char>(0x80 | (codePoint & 0x3F));
    return 4;
}

// ******************************************************************************** StringDecoder
/// @brief 開始引用符の後の生バイトを受け取り、復号済みバイトを出力キューに積む状態機械。
/// @note 出力キューは最大でUTF-8の1文字分(4バイト)。feed()の前にキューを空にしておくこと。
class StringDecoder {
public:
    /// @brief コンストラクタ。
    /// @param anchor エラー報告に使う入力位置（開始引用符の位置）。
    explicit StringDecoder(TextPosition anchor) : anchor_(anchor) {}

    /// @brief 生バイトを1つ処理する。
    /// @param input 入力バイト。
    void feed(char input) {
        switch (state_) {
            case StringDecoderState::Default:
                feedDefault(input);
                break;
            case StringDecoderState::Escape:
                feedEscape(input);
                break;
            case StringDecoderState::UnicodeHex:
                feedUnicodeHex(input);
                break;
            case StringDecoderState::SurrogateContinuation:
                feedSurrogateContinuation(input);
                break;
        }
    }

    /// @brief 終了引用符を処理済みならtrue。
    bool finished() const { return finished_; }

    /// @brief 出力キューに復号済みバイトがあればtrue。
    bool hasOutput() const { return outputPos_ < outputSize_; }

    /// @brief 出力キューの先頭バイトを取り出す。
    char popOutput() { return output_[outputPos_++]; }

    StringDecoderState state() const { return state_; }

    /// @brief 下位サロゲート待ちの上位サロゲートがあればtrue。
    bool surrogatePending() const { return pendingSurrogate_.has_value(); }

    TextPosition anchor() const { return anchor_; }

private:
    void feedDefault(char input) {
        switch (input) {
            case '"':
                finished_ = true;
                break;
            case '\\':
                state_ = StringDecoderState::Escape;
                break;
            default:
                emit(input);
                break;
        }
    }

    void feedEscape(char input) {
        if (input == 'u') {
            startUnicodeHex();
            return;
        }

        switch (input) {
            case '"':  emit('"'); break;
            case '\\': emit('\\'); break;
            case '/':  emit('/'); break;
            case 'b':  emit('\b'); break;
            case 'f':  emit('\f'); break;
            case 'n':  emit('\n'); break;
            case 'r':  emit('\r'); break;
            case 't':  emit('\t'); break;
            default:
                throw DecodeError(anchor_,
                    "bad escape character " + describeByte(input) + " while reading string");
        }
        state_ = StringDecoderState::Default;
    }

    void feedUnicodeHex(char input) {
        int digit = hexDigitToValue(input);
        if (digit == -1) {
            throw DecodeError(anchor_,
                "bad unicode escape character " + describeByte(input) + " while reading string");
        }
        codeUnit_ = (codeUnit_ << 4) | static_cast<char32_t>(digit);
        if (++hexCount_ < 4) {
            return;
        }

        if (!pendingSurrogate_) {
            if (isHighSurrogate(codeUnit_)) {
                pendingSurrogate_ = codeUnit_;
                surrogateBytes_ = 0;
                state_ = StringDecoderState::SurrogateContinuation;
                return;
            }
            emitCodePoint(codeUnit_);
        } else {
            if (!isLowSurrogate(codeUnit_)) {
                throw DecodeError(anchor_, "incomplete surrogate pair");
            }
            char32_t high = *pendingSurrogate_;
            pendingSurrogate_.reset();
            emitCodePoint(0x10000 + ((high - 0xD800) << 10) + (codeUnit_ - 0xDC00));
        }
        state_ = StringDecoderState::Default;
    }

    void feedSurrogateContinuation(char input) {
        // "\u"の2バイトを1つずつ確認する。
        const char expected = surrogateBytes_ == 0 ? '\\' : 'u';
        if (input != expected) {
            throw DecodeError(anchor_,
                std::string("expected '") + expected + "' for second surrogate, got bad byte " +
                describeByte(input));
        }
        if (++surrogateBytes_ == 2) {
            startUnicodeHex();
        }
    }

    void startUnicodeHex() {
        codeUnit_ = 0;
        hexCount_ = 0;
        state_ = StringDecoderState::UnicodeHex;
    }

    void emit(char c) {
        output_[0] = c;
        outputPos_ = 0;
        outputSize_ = 1;
    }

    void emitCodePoint(char32_t codePoint) {
        outputPos_ = 0;
        outputSize_ = encodeUtf8(codePoint, output_);
    }

    // @brief 16進数の桁を数値に変換
    static constexpr int hexDigitToValue(char c) {
        switch (c) {
            case '0': return 0;
            case '1': return 1;
            case '2': return 2;
            case '3': return 3;
            case '4': return 4;
            case '5': return 5;
            case '6': return 6;
            case '7': return 7;
            case '8': return 8;
            case '9': return 9;
            case 'a': case 'A': return 10;
            case 'b': case 'B': return 11;
            case 'c': case 'C': return 12;
            case 'd': case 'D': return 13;
            case 'e': case 'E': return 14;
            case 'f': case 'F': return 15;
            default: return -1;
        }
    }

    TextPosition anchor_;                                  ///< エラー報告用の入力位置
    StringDecoderState state_{StringDecoderState::Default};
    char32_t codeUnit_{0};                                 ///< 読み取り中の16進数
    int hexCount_{0};                                      ///< 読み取り済みの16進数の桁数
    std::optional<char32_t> pendingSurrogate_;             ///< 下位サロゲート待ちの上位サロゲート
    int surrogateBytes_{0};                                ///< SurrogateContinuationで確認済みのバイト数
    std::array<char, 4> output_{};                         ///< 復号済みバイトの出力キュー
    std::size_t outputPos_{0};                             ///< 出力キューの読み出し位置
    std::size_t outputSize_{0};                            ///< 出力キューの有効長
    bool finished_{false};                                 ///< 終了引用符を処理済みならtrue
};

// ******************************************************************************** StringReader
/// @brief 文字列トークンの本体を復号しながら逐次読み出すリーダー。
/// @note 親デコーダーとカーソルを共有する。読み切るまで親デコーダーを使ってはならない。
/// @tparam Source 入力元の型。
template <ByteSource Source>
class StringReader {
public:
    /// @brief コンストラクタ。開始引用符は消費済みであること。
    /// @param cursor 読み取り元のカーソル。
    explicit StringReader(ByteCursor<Source>& cursor)
        : cursor_(&cursor), decoder_(cursor.position()) {
        cursor_->setStringOpen(true);
    }

    // コピー禁止（1つのカーソルを読むリーダーは1つだけ）
    StringReader(const StringReader&) = delete;
    StringReader& operator=(const StringReader&) = delete;
    StringReader(StringReader&&) = default;
    StringReader& operator=(StringReader&&) = default;

    /// @brief 復号済みの文字列を最大sizeバイト読み出す。
    /// @param dst 書き込み先。
    /// @param size 書き込み先の容量。
    /// @return 書き込んだバイト数。終了引用符まで読み切った後は常に0。
    /// @note 入力元の例外はそのまま伝播する。
    std::size_t read(char* dst, std::size_t size) {
        std::size_t n = 0;
        while (n < size) {
            if (decoder_.hasOutput()) {
                dst[n++] = decoder_.popOutput();
                continue;
            }
            if (decoder_.finished()) {
                break;
            }

            auto input = cursor_->next();
            if (!input) {
                throw DecodeError(decoder_.anchor(), "unexpected end-of-stream while reading string");
            }
            decoder_.feed(*input);
            if (decoder_.finished()) {
                cursor_->setStringOpen(false);
            }
        }
        return n;
    }

    /// @brief 残りの文字列をすべて読み出す。
    /// @return 復号済みの文字列。
    std::string readAll() {
        std::string result;
        std::array<char, 256> chunk;
        for (;;) {
            auto n = read(chunk.data(), chunk.size());
            if (n == 0) {
                return result;
            }
            result.append(chunk.data(), n);
        }
    }

    /// @brief 終了引用符まで読み切ったらtrue。
    bool exhausted() const { return decoder_.finished() && !decoder_.hasOutput(); }

private:
    ByteCursor<Source>* cursor_;  ///< 読み取り元のカーソル（親デコーダーが所有）
    StringDecoder decoder_;       ///< 復号の状態機械
};

}  // namespace rai::jsonstream
