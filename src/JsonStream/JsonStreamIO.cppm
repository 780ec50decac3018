// @file JsonStreamIO.cppm
// @brief ストリーム・文字列・ファイルからトークン列を読み込む補助関数と、文字列トークンの転送。

module;
#include <array>
#include <cstddef>
#include <fstream>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

export module rai.jsonstream.json_stream_io;

import rai.jsonstream.byte_source;
import rai.jsonstream.json_stream_decoder;
import rai.jsonstream.json_token;
import rai.jsonstream.string_decoder;

namespace rai::jsonstream {

inline constexpr std::size_t copyChunkSize = 4096;  ///< copyString()の1回の読み出しサイズ（byte）

/// @brief 入力元を終端まで読み、トークン列を返す（コア関数）。
/// @tparam Source 入力元の型。
/// @param source 入力元。
/// @return 読み込んだトークン列。終端のEndOfStreamトークンは含まない。
template <ByteSource Source>
std::vector<JsonToken> readAllTokens(Source& source) {
    JsonStreamDecoder<Source> decoder(source);
    std::vector<JsonToken> tokens;
    for (;;) {
        auto token = decoder.nextToken();
        if (token.isEndOfStream()) {
            return tokens;
        }
        tokens.push_back(std::move(token));
    }
}

/// @brief 入力ストリームからトークン列を読み込む。
/// @param inputStream 入力元のストリーム。
/// @return 読み込んだトークン列。
export std::vector<JsonToken> readJsonTokens(std::istream& inputStream) {
    StreamByteSource source(inputStream);
    return readAllTokens(source);
}

/// @brief JSON文字列からトークン列を読み込む。
/// @param jsonText JSON形式の文字列。
/// @return 読み込んだトークン列。
export std::vector<JsonToken> readJsonTokensString(const std::string& jsonText) {
    MemoryByteSource source(jsonText);
    return readAllTokens(source);
}

/// @brief JSONファイルからトークン列を読み込む。
/// @param filename 入力元のファイル名。
/// @return 読み込んだトークン列。
export std::vector<JsonToken> readJsonTokensFile(const std::string& filename) {
    std::ifstream ifs(filename, std::ios::binary);
    if (!ifs.is_open()) {
        throw std::runtime_error("readJsonTokensFile: Cannot open file " + filename);
    }
    return readJsonTokens(ifs);
}

/// @brief 文字列リーダーの残りを出力ストリームへ転送する。
/// @tparam Source 入力元の型。
/// @param reader 転送元の文字列リーダー。
/// @param os 出力先のストリーム。
/// @return 転送したバイト数。
/// @note 文字列全体をメモリに保持しないため、巨大な文字列値の書き出しに使う。
export template <ByteSource Source>
std::size_t copyString(StringReader<Source>& reader, std::ostream& os) {
    std::array<char, copyChunkSize> chunk;
    std::size_t total = 0;
    for (;;) {
        auto n = reader.read(chunk.data(), chunk.size());
        if (n == 0) {
            return total;
        }
        os.write(chunk.data(), static_cast<std::streamsize>(n));
        if (os.bad()) {
            throw std::runtime_error("copyString: Error writing to output stream");
        }
        total += n;
    }
}

}  // namespace rai::jsonstream
