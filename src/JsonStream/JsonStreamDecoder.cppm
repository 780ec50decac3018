// @file JsonStreamDecoder.cppm
// @brief 入力元からJSONトークンを1つずつ取り出すプル型デコーダー。

module;
#include <cstddef>
#include <optional>
#include <string>

export module rai.jsonstream.json_stream_decoder;

import rai.jsonstream.byte_source;
import rai.jsonstream.byte_cursor;
import rai.jsonstream.decode_error;
import rai.jsonstream.json_token;
import rai.jsonstream.message_output;
import rai.jsonstream.number_scanner;
import rai.jsonstream.string_decoder;

export namespace rai::jsonstream {

// ******************************************************************************** JsonStreamDecoder
// @brief JSONトークンのプル型デコーダー
// @note 構文（括弧の対応や','と':'の位置）は検証しない。','と':'は空白と同じく読み飛ばす。
// @note スレッドセーフではない。同時に1つの操作のみ実行すること。
template <ByteSource Source>
class JsonStreamDecoder {
    // ******************************************************************************** 区切り文字のスキップ
private:
    // @brief 空白と','、':'を読み飛ばし、トークン先頭のバイトを返す
    // @return トークン先頭のバイト。入力終端ならstd::nullopt
    std::optional<char> skipSeparators() {
        for (;;) {
            auto input = cursor_.next();
            if (!input) {
                return std::nullopt;
            }
            cursor_.advancePosition(*input);
            switch (*input) {
                case ' ':
                case '\t':
                case '\r':
                case '\n':
                case ',':
                case ':':
                    continue;
                default:
                    return input;
            }
        }
    }

    // ******************************************************************************** トークンの判定
private:
    // @brief 先頭バイトでトークンの種類を判定して読み取る
    // @param c トークン先頭のバイト（消費済み）
    JsonTokenValue readToken(char c) {
        switch (c) {
            case '{':
            case '}':
            case '[':
            case ']':
                return json_token_detail::DelimVal{c};
            case '"': {
                StringReader<Source> reader(cursor_);
                return reader.readAll();
            }
            case 't':
                expectLiteral("rue");
                return json_token_detail::BoolVal{true};
            case 'f':
                expectLiteral("alse");
                return json_token_detail::BoolVal{false};
            case 'n':
                expectLiteral("ull");
                return json_token_detail::NullTag{};
            case '-': case '.':
            case '0': case '1': case '2': case '3': case '4':
            case '5': case '6': case '7': case '8': case '9': {
                cursor_.unread(c);
                NumberScanner<Source> scanner(cursor_);
                return scanner.scan();
            }
            default:
                throw DecodeError(cursor_.position(), "bad input byte " + describeByte(c));
        }
    }

    // @brief リテラルの残りの文字を照合する
    // @param rest 先頭文字を除いたリテラル
    void expectLiteral(const char* rest) {
        for (const char* p = rest; *p != '\0'; ++p) {
            auto input = cursor_.next();
            if (!input) {
                throw DecodeError(cursor_.position(), "unexpected end-of-stream while reading literal");
            }
            if (*input != *p) {
                throw DecodeError(cursor_.position(),
                    "unexpected input " + describeByte(*input) + " while reading literal");
            }
        }
    }

    // @brief 読み切られていない文字列リーダーがあれば警告する
    void warnIfStringOpen() {
        if (cursor_.stringOpen()) {
            warningOutput_->warning("Token requested while a string reader opened at line " +
                                    std::to_string(cursor_.position().line) + " column " +
                                    std::to_string(cursor_.position().column) +
                                    " is not drained");
            cursor_.setStringOpen(false);
        }
    }

    // ******************************************************************************** 構築
public:
    // @brief コンストラクタ（入力元を指定）
    // @param source 入力元の参照
    // @param bufferCapacity 読み込みバッファの容量
    explicit JsonStreamDecoder(Source& source, std::size_t bufferCapacity = defaultBufferCapacity)
        : cursor_(source, bufferCapacity), warningOutput_(&defaultMessageOutput()) {}

    // @brief コンストラクタ（入力元と警告出力オブジェクトを指定）
    // @param source 入力元の参照
    // @param warnOut 警告メッセージの出力先
    // @param bufferCapacity 読み込みバッファの容量
    JsonStreamDecoder(Source& source, MessageOutput& warnOut,
                      std::size_t bufferCapacity = defaultBufferCapacity)
        : cursor_(source, bufferCapacity), warningOutput_(&warnOut) {}

    JsonStreamDecoder(const JsonStreamDecoder&) = delete;
    JsonStreamDecoder& operator=(const JsonStreamDecoder&) = delete;

    // ******************************************************************************** トークン読み取り
public:
    // @brief 次のトークンを読み取る
    // @return 読み取ったトークン。入力終端ではEndOfStreamトークン
    // @note DecodeErrorを送出した後のデコーダーは使用できない
    JsonToken nextToken() {
        warnIfStringOpen();
        auto c = skipSeparators();
        const TextPosition tokenPos = cursor_.position();
        if (!c) {
            return JsonToken{json_token_detail::EndOfStreamTag{}, tokenPos};
        }
        return JsonToken{readToken(*c), tokenPos};
    }

    // @brief 次の文字列トークンを逐次読み出すリーダーを返す
    // @return 文字列リーダー。入力終端ではstd::nullopt
    // @note 次のトークンが文字列でなければNotStringErrorを送出する。この場合入力は消費しない
    // @note 返したリーダーを読み切るまで、このデコーダーを使ってはならない
    std::optional<StringReader<Source>> stringReader() {
        warnIfStringOpen();
        auto c = skipSeparators();
        if (!c) {
            return std::nullopt;
        }
        if (*c != '"') {
            cursor_.unread(*c);
            cursor_.retreatColumn();
            throw NotStringError();
        }
        return StringReader<Source>(cursor_);
    }

    // @brief 直前の区切り位置を返す
    TextPosition position() const { return cursor_.position(); }

    // ******************************************************************************** メンバー変数
private:
    ByteCursor<Source> cursor_;        ///< 入力元を読むカーソル
    MessageOutput* warningOutput_;     ///< 警告メッセージ出力先
};

}  // namespace rai::jsonstream
