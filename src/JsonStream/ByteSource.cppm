// @file ByteSource.cppm
// @brief デコーダーへバイト列を供給する入力元の定義。

module;
#include <algorithm>
#include <concepts>
#include <cstddef>
#include <istream>
#include <stdexcept>
#include <string>
#include <utility>

export module rai.jsonstream.byte_source;

export namespace rai::jsonstream {

// @brief バイト列取得元のconcept
// @note read()は書き込んだbyte数を返し、0は入力終端を意味する。
//       読み込み失敗は例外で通知し、デコーダーはそれを包まずにそのまま伝播する。
template <typename T>
concept ByteSource = requires(T& t, char* dst, std::size_t size) {
    { t.read(dst, size) } -> std::same_as<std::size_t>;
};

/// @brief 入力ストリームからバイト列を読み取る入力元。
/// @note std::istream::read()は要求サイズが揃うか入力終端に達するまで戻らない。
///       パイプやソケットでは、バッファ容量に満たない入力は後続のデータが届くまでトークン化されない。
class StreamByteSource {
public:
    /// @brief 入力元を構築する。
    /// @param stream 入力ストリーム。
    explicit StreamByteSource(std::istream& stream) : stream_(stream) {}

    // コピー・ムーブ禁止
    StreamByteSource(const StreamByteSource&) = delete;
    StreamByteSource& operator=(const StreamByteSource&) = delete;
    StreamByteSource(StreamByteSource&&) = delete;
    StreamByteSource& operator=(StreamByteSource&&) = delete;

    /// @brief 最大sizeバイトを読み込む。
    /// @param dst 書き込み先。
    /// @param size 書き込み先の容量。
    /// @return 読み込んだバイト数。入力終端では0。
    std::size_t read(char* dst, std::size_t size) {
        if (stream_.eof()) {
            return 0;
        }
        stream_.read(dst, static_cast<std::streamsize>(size));
        // eof()はgcount()が指定サイズ未満のときに立つため、失敗判定にはbad()を使う。
        if (stream_.bad()) {
            throw std::runtime_error("StreamByteSource: Error reading from input stream");
        }
        return static_cast<std::size_t>(stream_.gcount());
    }

private:
    std::istream& stream_;  ///< 入力ストリーム。
};

/// @brief 保持した文字列からバイト列を供給する入力元。
class MemoryByteSource {
public:
    /// @brief 入力元を構築する。
    /// @param text 入力テキスト。
    explicit MemoryByteSource(std::string text) : text_(std::move(text)), pos_(0) {}

    /// @brief 最大sizeバイトを読み込む。
    /// @param dst 書き込み先。
    /// @param size 書き込み先の容量。
    /// @return 読み込んだバイト数。入力終端では0。
    std::size_t read(char* dst, std::size_t size) {
        auto count = std::min(size, text_.size() - pos_);
        std::copy_n(text_.data() + pos_, count, dst);
        pos_ += count;
        return count;
    }

private:
    std::string text_;  ///< 入力テキスト。
    std::size_t pos_;   ///< 次に読み出す位置。
};

}  // namespace rai::jsonstream
