#ifndef H_S3STREAM_TYPES_V0
#define H_S3STREAM_TYPES_V0

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

    typedef enum
    {
        S3StreamStatusCode_Success = 0,
        S3StreamStatusCode_InvalidArgument,
        S3StreamStatusCode_InvalidSettings,
        S3StreamStatusCode_IOError,
        S3StreamStatusCode_InternalError,
        S3StreamStatusCode_OutOfMemory,
        S3StreamStatusCodeCount,
    } S3StreamStatusCode;

    typedef enum
    {
        S3StreamLogLevel_Debug,
        S3StreamLogLevel_Info,
        S3StreamLogLevel_Warning,
        S3StreamLogLevel_Error,
        S3StreamLogLevel_None,
        S3StreamLogLevelCount
    } S3StreamLogLevel;

    /**
     * @brief Credentials and connection settings for the object store.
     * @details Each field is optional. A NULL field falls back to the
     * corresponding environment variable (AWS_ACCESS_KEY_ID,
     * AWS_SECRET_ACCESS_KEY, AWS_REGION, AWS_SESSION_TOKEN, AWS_ENDPOINT), and
     * if that is unset, to the provider default.
     */
    typedef struct
    {
        const char* access_key_id;
        const char* secret_access_key;
        const char* region;
        const char* session_token;
        const char* endpoint;
    } S3StreamCredentials;

#ifdef __cplusplus
}
#endif

#endif // H_S3STREAM_TYPES_V0
