/**
 * @file media_transport.h
 * @brief Remote file API consumed by the media transfer engine
 *
 * Wire encoding is out of scope; implementations adapt a concrete client.
 * Failures carry an error message. The engine only distinguishes
 * "FILE_REFERENCE_EXPIRED" (see is_file_reference_expired()).
 */

#ifndef KCENON_MEDIA_TRANSFER_TRANSPORT_MEDIA_TRANSPORT_H
#define KCENON_MEDIA_TRANSFER_TRANSPORT_MEDIA_TRANSPORT_H

#include <cstdint>

#include "kcenon/media_transfer/core/media_types.h"
#include "kcenon/media_transfer/core/types.h"

namespace kcenon::media_transfer {

/**
 * @brief Transport interface for part-based uploads and downloads
 *
 * Calls block the calling lane until the remote answers. There is no
 * timeout layer in the engine; implementations own their timeouts.
 *
 * @note Implementations must be safe to call from several lanes at once.
 */
class media_transport {
public:
    virtual ~media_transport() = default;

    media_transport() = default;
    media_transport(const media_transport&) = delete;
    auto operator=(const media_transport&) -> media_transport& = delete;

    /**
     * @brief Obtain upload geometry and remote identity for a staged file
     * @param meta Metadata of the staged file
     * @return Part size, last part size, part count and file identity
     */
    [[nodiscard]] virtual auto prepare_uploading_file(const file_meta& meta)
        -> result<upload_file_params> = 0;

    /**
     * @brief Upload one part
     * @param bytes Part payload
     * @param params Parameters returned by prepare_uploading_file()
     * @param part Zero-based part index
     */
    [[nodiscard]] virtual auto upload_file_part(const byte_buffer& bytes,
                                                const upload_file_params& params,
                                                int64_t part) -> result<void> = 0;

    /**
     * @brief Download one byte range
     * @param request Locators plus offset/size of the range
     * @return Part bytes or an error carrying the server message
     */
    [[nodiscard]] virtual auto download_file_part(const download_part_request& request)
        -> result<byte_buffer> = 0;
};

}  // namespace kcenon::media_transfer

#endif  // KCENON_MEDIA_TRANSFER_TRANSPORT_MEDIA_TRANSPORT_H
