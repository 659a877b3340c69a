/// @file s3stream-upload.cpp
/// @brief Stream a file, or standard input, to an S3 object.
///
/// Usage: s3stream-upload <s3://bucket/key> [file]
///
/// Credentials are read from AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY,
/// AWS_REGION, AWS_SESSION_TOKEN, and AWS_ENDPOINT.

#include "s3stream.h"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <vector>

int
main(int argc, char* argv[])
{
    if (argc < 2 || argc > 3) {
        std::cerr << "Usage: " << argv[0] << " <s3://bucket/key> [file]"
                  << std::endl;
        return 1;
    }

    std::ifstream file;
    std::istream* input = &std::cin;
    if (argc == 3) {
        file.open(argv[2], std::ios::binary);
        if (!file.is_open()) {
            std::cerr << "Failed to open " << argv[2] << std::endl;
            return 1;
        }
        input = &file;
    }

    S3StreamSettings settings{};
    settings.uri = argv[1];

    S3Stream* stream = S3Stream_create(&settings);
    if (stream == nullptr) {
        std::cerr << "Failed to create stream for " << argv[1] << std::endl;
        return 1;
    }

    std::vector<char> chunk(1 << 20);
    while (*input) {
        input->read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        const auto nread = static_cast<size_t>(input->gcount());
        if (nread == 0) {
            break;
        }

        size_t bytes_out = 0;
        if (const auto status =
              S3Stream_write(stream, chunk.data(), nread, &bytes_out);
            status != S3StreamStatusCode_Success) {
            std::cerr << "Write failed: "
                      << S3Stream_get_status_message(status) << std::endl;
            S3Stream_destroy(stream);
            return 1;
        }
    }

    size_t bytes_uploaded = 0;
    if (const auto status = S3Stream_finish(stream, &bytes_uploaded);
        status != S3StreamStatusCode_Success) {
        std::cerr << "Upload failed: " << S3Stream_get_status_message(status)
                  << std::endl;
        return 1;
    }

    std::cout << "Uploaded " << bytes_uploaded << " bytes to " << argv[1]
              << std::endl;

    return 0;
}
