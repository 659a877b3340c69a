#pragma once

#include "s3stream.types.h"

#ifdef __cplusplus
extern "C"
{
#endif

#define S3STREAM_API_VERSION "0.1.0"

    /**
     * @brief The settings for an S3 stream.
     * @details The URI names the destination object and must be of the form
     * "s3://bucket/path/to/object". Credentials are optional; any field left
     * NULL is read from the environment.
     * @note A split threshold of 0 selects the default part size of 32 MiB.
     */
    typedef struct S3StreamSettings_s
    {
        const char* uri; /**< Destination object, e.g. s3://bucket/key. */
        S3StreamCredentials* credentials; /**< Optional credential overrides. */
        size_t split_threshold_bytes; /**< Buffered bytes at which a part is sealed. */
    } S3StreamSettings;

    typedef struct S3Stream_s S3Stream;

    /**
     * @brief Get the version of the S3 stream API.
     * @return The version of the S3 stream API.
     */
    const char* S3Stream_get_api_version();

    /**
     * @brief Set the log level for the S3 stream API.
     * @param level The log level.
     * @return S3StreamStatusCode_Success on success, or an error code on
     * failure.
     */
    S3StreamStatusCode S3Stream_set_log_level(S3StreamLogLevel level);

    /**
     * @brief Get the log level for the S3 stream API.
     * @return The log level for the S3 stream API.
     */
    S3StreamLogLevel S3Stream_get_log_level();

    /**
     * @brief Get the message for the given status code.
     * @param status The status code.
     * @return A human-readable status message.
     */
    const char* S3Stream_get_status_message(S3StreamStatusCode status);

    /**
     * @brief Check that the settings name a valid s3:// location.
     * @param[in] settings The settings for the S3 stream.
     * @return S3StreamStatusCode_Success if the URI is usable,
     * S3StreamStatusCode_InvalidSettings if it is missing or malformed, or
     * S3StreamStatusCode_InvalidArgument if @p settings is NULL.
     */
    S3StreamStatusCode S3Stream_validate_settings(
      const S3StreamSettings* settings);

    /**
     * @brief Create an S3 stream.
     * @details No data is sent to the object store until the stream is
     * finished.
     * @param[in] settings The settings for the S3 stream.
     * @return A pointer to the S3 stream struct, or NULL on failure.
     */
    S3Stream* S3Stream_create(S3StreamSettings* settings);

    /**
     * @brief Destroy an S3 stream without uploading anything.
     * @param stream The S3 stream struct to destroy.
     */
    void S3Stream_destroy(S3Stream* stream);

    /**
     * @brief Append data to the S3 stream.
     * @details This function never performs network I/O. Data is buffered in
     * memory until the stream is finished.
     * @param[in, out] stream The S3 stream struct.
     * @param[in] data The data to append.
     * @param[in] bytes_in The number of bytes in @p data.
     * @param[out] bytes_out The number of bytes accepted by the stream.
     * @return S3StreamStatusCode_Success on success, or an error code on
     * failure.
     */
    S3StreamStatusCode S3Stream_write(S3Stream* stream,
                                      const void* data,
                                      size_t bytes_in,
                                      size_t* bytes_out);

    /**
     * @brief Flush the S3 stream. This is a no-op; all data is uploaded when
     * the stream is finished.
     */
    S3StreamStatusCode S3Stream_flush(S3Stream* stream);

    /**
     * @brief Get the total number of bytes written to the stream so far.
     * @param[in] stream The S3 stream struct.
     * @param[out] bytes_written The number of bytes written.
     * @return S3StreamStatusCode_Success on success, or an error code on
     * failure.
     */
    S3StreamStatusCode S3Stream_get_bytes_written(const S3Stream* stream,
                                                  size_t* bytes_written);

    /**
     * @brief Upload all buffered data and complete the object.
     * @details This function blocks until the upload has finished. The stream
     * is consumed and freed whether or not the upload succeeds; it must not be
     * used afterward.
     * @param[in] stream The S3 stream struct.
     * @param[out] bytes_out The number of bytes uploaded. May be NULL.
     * @return S3StreamStatusCode_Success on success, or an error code on
     * failure.
     */
    S3StreamStatusCode S3Stream_finish(S3Stream* stream, size_t* bytes_out);

#ifdef __cplusplus
}
#endif
