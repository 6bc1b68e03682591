#pragma once

namespace partstream {

// Decodes percent-encoded sequences of [first, last) in place, compacting the buffer.
// Returns a pointer to the new logical end of the decoded sequence.
// Invalid sequences (truncated % or non-hex digits) are kept literally.
char* PercentDecodeInPlace(char* first, char* last);

}  // namespace partstream
