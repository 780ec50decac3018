// @file MessageOutput.cppm
// @brief 警告メッセージの出力先。

module;
#include <iostream>
#include <string>

export module rai.jsonstream.message_output;

export namespace rai::jsonstream {

// @brief メッセージ出力用の基底クラス。
class MessageOutput {
public:
    virtual ~MessageOutput() = default;

    /// @brief 警告メッセージを出力する。
    /// @param msg 出力するメッセージ。
    virtual void warning(const std::string& msg) = 0;
};

// @brief 標準出力への警告出力
class StdoutMessageOutput : public MessageOutput {
public:
    /// @brief 警告メッセージを標準出力に出力する。
    /// @param msg 出力するメッセージ。
    void warning(const std::string& msg) override {
        // 単純なロギングのみを行う。フォーマットは呼び出し元に依存させる。
        std::cout << "Warning: " << msg << std::endl;
    }
};

/// @brief 出力先未指定時に使う共有の標準出力インスタンスを返す。
/// @return 標準出力への警告出力。
MessageOutput& defaultMessageOutput() {
    static StdoutMessageOutput output;
    return output;
}

}  // namespace rai::jsonstream
