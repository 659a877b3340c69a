#include "s3stream.h"
#include "s3.location.hh"
#include "s3.stream.hh"
#include "macros.hh"

#include <memory>

extern "C"
{
    const char* S3Stream_get_api_version()
    {
        return S3STREAM_API_VERSION;
    }

    S3StreamStatusCode S3Stream_set_log_level(S3StreamLogLevel level_)
    {
        LogLevel level;
        switch (level_) {
            case S3StreamLogLevel_Debug:
                level = LogLevel_Debug;
                break;
            case S3StreamLogLevel_Info:
                level = LogLevel_Info;
                break;
            case S3StreamLogLevel_Warning:
                level = LogLevel_Warning;
                break;
            case S3StreamLogLevel_Error:
                level = LogLevel_Error;
                break;
            case S3StreamLogLevel_None:
                level = LogLevel_None;
                break;
            default:
                return S3StreamStatusCode_InvalidArgument;
        }

        try {
            Logger::set_log_level(level);
        } catch (const std::exception& e) {
            LOG_ERROR("Error setting log level: ", e.what());
            return S3StreamStatusCode_InternalError;
        }
        return S3StreamStatusCode_Success;
    }

    S3StreamLogLevel S3Stream_get_log_level()
    {
        S3StreamLogLevel level;
        switch (Logger::get_log_level()) {
            case LogLevel_Debug:
                level = S3StreamLogLevel_Debug;
                break;
            case LogLevel_Info:
                level = S3StreamLogLevel_Info;
                break;
            case LogLevel_Warning:
                level = S3StreamLogLevel_Warning;
                break;
            case LogLevel_None:
                level = S3StreamLogLevel_None;
                break;
            default:
                level = S3StreamLogLevel_Error;
                break;
        }
        return level;
    }

    const char* S3Stream_get_status_message(S3StreamStatusCode code)
    {
        switch (code) {
            case S3StreamStatusCode_Success:
                return "Success";
            case S3StreamStatusCode_InvalidArgument:
                return "Invalid argument";
            case S3StreamStatusCode_InvalidSettings:
                return "Invalid settings";
            case S3StreamStatusCode_IOError:
                return "I/O error";
            case S3StreamStatusCode_InternalError:
                return "Internal error";
            case S3StreamStatusCode_OutOfMemory:
                return "Out of memory";
            default:
                return "Unknown error";
        }
    }

    S3StreamStatusCode S3Stream_validate_settings(
      const struct S3StreamSettings_s* settings)
    {
        EXPECT_VALID_ARGUMENT(settings, "Null pointer: settings");

        if (settings->uri == nullptr || *settings->uri == '\0') {
            LOG_ERROR("S3 URI is missing");
            return S3StreamStatusCode_InvalidSettings;
        }

        try {
            (void)s3stream::S3Location::parse(settings->uri);
        } catch (const std::invalid_argument&) {
            return S3StreamStatusCode_InvalidSettings;
        }

        return S3StreamStatusCode_Success;
    }

    S3Stream_s* S3Stream_create(struct S3StreamSettings_s* settings)
    {
        S3Stream_s* stream = nullptr;

        try {
            stream = new S3Stream_s(settings);
        } catch (const std::bad_alloc&) {
            LOG_ERROR("Failed to allocate memory for S3 stream");
        } catch (const std::invalid_argument& e) {
            LOG_ERROR("Invalid S3 stream settings: ", e.what());
        } catch (const std::exception& e) {
            LOG_ERROR("Error creating S3 stream: ", e.what());
        }

        return stream;
    }

    void S3Stream_destroy(struct S3Stream_s* stream)
    {
        if (stream == nullptr) {
            return;
        }

        if (const auto nbytes = stream->bytes_written(); nbytes > 0) {
            LOG_WARNING("Destroying unfinished S3 stream, discarding ",
                        nbytes,
                        " bytes");
        }

        delete stream;
    }

    S3StreamStatusCode S3Stream_write(struct S3Stream_s* stream,
                                      const void* data,
                                      size_t bytes_in,
                                      size_t* bytes_out)
    {
        EXPECT_VALID_ARGUMENT(stream, "Null pointer: stream");
        EXPECT_VALID_ARGUMENT(data || bytes_in == 0, "Null pointer: data");
        EXPECT_VALID_ARGUMENT(bytes_out, "Null pointer: bytes_out");

        try {
            *bytes_out = stream->write(data, bytes_in);
        } catch (const std::bad_alloc&) {
            LOG_ERROR("Failed to allocate memory for ", bytes_in, " bytes");
            return S3StreamStatusCode_OutOfMemory;
        } catch (const std::exception& e) {
            LOG_ERROR("Error writing data: ", e.what());
            return S3StreamStatusCode_InternalError;
        }

        return S3StreamStatusCode_Success;
    }

    S3StreamStatusCode S3Stream_flush(struct S3Stream_s* stream)
    {
        EXPECT_VALID_ARGUMENT(stream, "Null pointer: stream");

        try {
            stream->flush();
        } catch (const std::exception& e) {
            LOG_ERROR("Error flushing stream: ", e.what());
            return S3StreamStatusCode_InternalError;
        }

        return S3StreamStatusCode_Success;
    }

    S3StreamStatusCode S3Stream_get_bytes_written(
      const struct S3Stream_s* stream,
      size_t* bytes_written)
    {
        EXPECT_VALID_ARGUMENT(stream, "Null pointer: stream");
        EXPECT_VALID_ARGUMENT(bytes_written, "Null pointer: bytes_written");

        *bytes_written = stream->bytes_written();
        return S3StreamStatusCode_Success;
    }

    S3StreamStatusCode S3Stream_finish(struct S3Stream_s* stream,
                                       size_t* bytes_out)
    {
        EXPECT_VALID_ARGUMENT(stream, "Null pointer: stream");

        std::unique_ptr<S3Stream_s> owned(stream);

        size_t nbytes = 0;
        try {
            nbytes = owned->finish();
        } catch (const std::exception& e) {
            LOG_ERROR("Error finishing stream: ", e.what());
            return S3StreamStatusCode_IOError;
        }

        if (bytes_out) {
            *bytes_out = nbytes;
        }

        return S3StreamStatusCode_Success;
    }
}
