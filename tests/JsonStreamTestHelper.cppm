module;

#include <gtest/gtest.h>
#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

export module rai.jsonstream.test_helper;

import rai.jsonstream.json_stream_decoder;
import rai.jsonstream.json_token;
import rai.jsonstream.message_output;
import rai.jsonstream.byte_source;

export namespace rai::jsonstream::test {

/// @brief テスト用の入出力エラー。デコーダーが包まずに伝播することを確認する。
class SourceFailure : public std::runtime_error {
public:
    SourceFailure() : std::runtime_error("random IO error") {}
};

/// @brief 1回のread()で最大chunkSizeバイトずつ返す入力元。
/// @note データを返し終えた後、failAtEndがtrueならSourceFailureを送出し、falseなら0を返す。
class ChunkedByteSource {
public:
    ChunkedByteSource(std::string data, std::size_t chunkSize, bool failAtEnd = false)
        : data_(std::move(data)), chunkSize_(chunkSize), failAtEnd_(failAtEnd) {}

    std::size_t read(char* dst, std::size_t size) {
        ++readCalls_;
        if (pos_ >= data_.size()) {
            if (failAtEnd_) {
                throw SourceFailure();
            }
            return 0;
        }
        auto count = std::min({size, chunkSize_, data_.size() - pos_});
        std::copy_n(data_.data() + pos_, count, dst);
        pos_ += count;
        return count;
    }

    /// @brief read()が呼ばれた回数。
    std::size_t readCalls() const { return readCalls_; }

private:
    std::string data_;
    std::size_t chunkSize_;
    bool failAtEnd_;
    std::size_t pos_ = 0;
    std::size_t readCalls_ = 0;
};

/// @brief データを1バイトずつ返した後、入出力エラーを送出する入力元。
ChunkedByteSource makeFailingSource(std::string data) {
    return ChunkedByteSource(std::move(data), 1, true);
}

/// @brief 警告メッセージを記録する出力先。
class RecordingMessageOutput : public MessageOutput {
public:
    void warning(const std::string& msg) override { warnings.push_back(msg); }

    std::vector<std::string> warnings;
};

/// @brief デコーダーを終端まで読み、EndOfStreamを除くトークン値の列を返す。
template <typename Source>
std::vector<JsonTokenValue> drainTokens(JsonStreamDecoder<Source>& decoder) {
    std::vector<JsonTokenValue> values;
    for (;;) {
        auto token = decoder.nextToken();
        if (token.isEndOfStream()) {
            return values;
        }
        values.push_back(std::move(token.value));
    }
}

/// @brief 次のトークンが期待値と一致することを確認する。
template <typename Source>
void expectToken(JsonStreamDecoder<Source>& decoder, const JsonTokenValue& expected) {
    auto token = decoder.nextToken();
    EXPECT_EQ(token.value, expected);
}

/// @brief 入力終端に達していることを確認する。
template <typename Source>
void expectEndOfStream(JsonStreamDecoder<Source>& decoder) {
    EXPECT_EQ(decoder.nextToken().type(), JsonTokenType::EndOfStream);
}

/// @brief UTF-8文字列をJSON文字列リテラルの本体にエスケープする。
/// @note 引用符・'\'・制御文字・非ASCII文字をすべてエスケープし、BMP外はサロゲートペアにする。
std::string escapeJsonString(const std::u32string& text) {
    std::string out;
    auto appendUnit = [&out](unsigned unit) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04X", unit);
        out += buf;
    };
    for (char32_t c : text) {
        switch (c) {
            case U'"':  out += "\\\""; break;
            case U'\\': out += "\\\\"; break;
            case U'/':  out += "\\/"; break;
            case U'\b': out += "\\b"; break;
            case U'\f': out += "\\f"; break;
            case U'\n': out += "\\n"; break;
            case U'\r': out += "\\r"; break;
            case U'\t': out += "\\t"; break;
            default:
                if (c >= 0x20 && c < 0x7F) {
                    out += static_cast<char>(c);
                } else if (c > 0xFFFF) {
                    char32_t v = c - 0x10000;
                    appendUnit(static_cast<unsigned>(0xD800 + (v >> 10)));
                    appendUnit(static_cast<unsigned>(0xDC00 + (v & 0x3FF)));
                } else {
                    appendUnit(static_cast<unsigned>(c));
                }
                break;
        }
    }
    return out;
}

/// @brief UTF-32文字列をUTF-8に変換する（期待値の作成用）。
std::string toUtf8(const std::u32string& text) {
    std::string out;
    for (char32_t c : text) {
        if (c <= 0x7F) {
            out += static_cast<char>(c);
        } else if (c <= 0x7FF) {
            out += static_cast<char>(0xC0 | (c >> 6));
            out += static_cast<char>(0x80 | (c & 0x3F));
        } else if (c <= 0xFFFF) {
            out += static_cast<char>(0xE0 | (c >> 12));
            out += static_cast<char>(0x80 | ((c >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (c & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (c >> 18));
            out += static_cast<char>(0x80 | ((c >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((c >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (c & 0x3F));
        }
    }
    return out;
}

} // namespace rai::jsonstream::test
