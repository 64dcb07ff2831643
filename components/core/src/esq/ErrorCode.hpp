#ifndef ESQ_ERRORCODE_HPP
#define ESQ_ERRORCODE_HPP

namespace esq {
typedef enum {
    ErrorCode_Success = 0,
    ErrorCode_Failure,
    ErrorCode_NotInit,
    ErrorCode_NoMem,
} ErrorCode;
}  // namespace esq

#endif  // ESQ_ERRORCODE_HPP
