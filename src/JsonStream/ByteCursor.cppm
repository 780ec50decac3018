// @file ByteCursor.cppm
// @brief 入力元からチャンク単位で読み込み、1バイトの押し戻しを提供するカーソル。

module;
#include <cassert>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <vector>

export module rai.jsonstream.byte_cursor;

import rai.jsonstream.byte_source;
import rai.jsonstream.decode_error;

export namespace rai::jsonstream {

/// @brief 既定の読み込みバッファ容量(byte)。
constexpr std::size_t defaultBufferCapacity = 1024;

/// @brief 入力元から1バイトずつ取り出すカーソル。
/// @note 読み込みバッファは再利用し、押し戻しは常に1バイトまで。
/// @tparam Source 入力元の型。
template <ByteSource Source>
class ByteCursor {
public:
    /// @brief コンストラクタ。
    /// @param source 入力元の参照。
    /// @param bufferCapacity 1回の読み込みで要求するバイト数。
    explicit ByteCursor(Source& source, std::size_t bufferCapacity = defaultBufferCapacity)
        : source_(source), validSize_(0), pos_(0), eof_(false), stringOpen_(false) {
        if (bufferCapacity == 0) {
            throw std::invalid_argument("bufferCapacity must be at least 1");
        }
        buffer_.resize(bufferCapacity);
    }

    // コピー・ムーブ禁止（文字列リーダーが参照を保持するため）
    ByteCursor(const ByteCursor&) = delete;
    ByteCursor& operator=(const ByteCursor&) = delete;
    ByteCursor(ByteCursor&&) = delete;
    ByteCursor& operator=(ByteCursor&&) = delete;

    /// @brief 次のバイトを取得する。
    /// @return 取得したバイト。入力終端ではstd::nullopt。
    /// @note 入力元の例外はそのまま伝播する。
    std::optional<char> next() {
        if (pushedBack_) {
            char c = *pushedBack_;
            pushedBack_.reset();
            return c;
        }
        if (pos_ >= validSize_ && !refill()) {
            return std::nullopt;
        }
        return buffer_[pos_++];
    }

    /// @brief 直前に取得したバイトを押し戻す。
    /// @param c 押し戻すバイト。
    /// @note 押し戻しは1バイトまで。次のnext()で返される。
    void unread(char c) {
        assert(!pushedBack_);
        pushedBack_ = c;
    }

    /// @brief 区切り位置で記録した入力位置を返す。
    TextPosition position() const { return position_; }

    /// @brief 区切り文字の読み飛ばしで入力位置を進める。
    /// @param c 読み飛ばしたバイト。
    void advancePosition(char c) {
        if (c == '\n') {
            position_.line++;
            position_.column = 1;
        } else {
            position_.column++;
        }
    }

    /// @brief 押し戻したトークン先頭バイトの分だけ桁番号を戻す。
    /// @note トークン先頭バイトは改行ではないため、桁のみ戻せばよい。
    void retreatColumn() {
        assert(position_.column > 1);
        position_.column--;
    }

    /// @brief 文字列リーダーが読み取り中かどうか。
    bool stringOpen() const { return stringOpen_; }

    /// @brief 文字列リーダーの読み取り状態を設定する。
    void setStringOpen(bool open) { stringOpen_ = open; }

private:
    /// @brief 入力元から次のチャンクを読み込む。
    /// @return 読み込めればtrue。入力終端ならfalse。
    bool refill() {
        if (eof_) {
            return false;
        }
        auto bytesRead = source_.read(buffer_.data(), buffer_.size());
        if (bytesRead == 0) {
            // 0バイトの読み込みは入力終端として扱い、以降は入力元を呼ばない。
            eof_ = true;
            return false;
        }
        validSize_ = bytesRead;
        pos_ = 0;
        return true;
    }

    Source& source_;                   ///< 入力元の参照
    std::vector<char> buffer_;         ///< 読み込みバッファ（再利用する）
    std::size_t validSize_;            ///< バッファの有効データ長
    std::size_t pos_;                  ///< バッファ内の現在位置
    std::optional<char> pushedBack_;   ///< 押し戻されたバイト
    bool eof_;                         ///< 入力終端到達フラグ
    TextPosition position_;            ///< 区切り位置での入力位置
    bool stringOpen_;                  ///< 文字列リーダーが読み取り中ならtrue
};

}  // namespace rai::jsonstream
