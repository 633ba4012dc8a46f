#pragma once

#include "core/command_line.hpp"
#include "core/dlp_client.hpp"
#include <ostream>

/**
 * @brief Runs one redaction against a DlpClient and writes the result
 *
 * String mode prints each returned item as a UTF-8 line to the output
 * stream. File mode writes the single returned item's bytes to the output
 * path, truncating it first.
 */
class RedactCommand
{
public:
    RedactCommand(DlpClient &client, std::ostream &out) : client_(client), out_(out) {}

    void redactString(const RedactStringIntent &intent);

    /**
     * @brief Redact an image file
     * @throws IoError if the input cannot be read or the output cannot be written
     * @throws RemoteError if the service does not return exactly one item
     */
    void redactFile(const RedactFileIntent &intent);

private:
    DlpClient &client_;
    std::ostream &out_;
};
