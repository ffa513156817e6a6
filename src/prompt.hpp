#pragma once
#include <string>

namespace ledgerchat {

// System preamble for a round trip that offers tools.
std::string build_system_prompt();

// System preamble for the follow-up round trip that turns tool results into
// a final answer (no tools offered).
std::string build_final_answer_prompt();

// System preamble for a streamed round trip.
std::string build_streaming_prompt();

} // namespace ledgerchat
