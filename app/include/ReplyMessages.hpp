#ifndef REPLY_MESSAGES_HPP
#define REPLY_MESSAGES_HPP

// Fixed user-facing sentences. Provider errors are never shown verbatim.
namespace ReplyMessages {

inline constexpr const char* kConnectionTrouble =
    "I'm sorry, I'm having trouble connecting to my AI service right now. Please try again later.";
inline constexpr const char* kNotUnderstood =
    "I didn't understand that. Could you please rephrase?";
inline constexpr const char* kSomethingWentWrong =
    "I'm sorry, something went wrong. Please try again.";
inline constexpr const char* kSessionError =
    "I'm sorry, I encountered an error. Please try again.";

inline constexpr const char* kNoInput =
    "I didn't receive any input. Could you please say something?";
inline constexpr const char* kEnterMessage = "Please enter a message.";

} // namespace ReplyMessages

#endif // REPLY_MESSAGES_HPP
