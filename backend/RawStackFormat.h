#pragma once
#ifndef O2_RAW_STACK_FORMAT_H
#define O2_RAW_STACK_FORMAT_H

/* System */
#include <stdint.h>

/* Layout of the raw stack file (all little endian):
   RawStackHeader, then for each frame RawStackFrameMeta followed by
   width * height 16-bit pixels. The frame count in the header is updated
   after every written frame so an interrupted file stays readable. */

/// Identifies raw stack format in RawStackHeader.signature ("O2S" + null).
#define O2S_SIGNATURE   ((uint32_t)0x0053324F)

/** Raw stack file versions.
    Higher version must have higher number assigned.
    @{ */
/// Version 1.0
#define O2S_VERSION_1_0 ((uint16_t)0x0100)
/** @} */

/// Length of RawStackHeader.modeName including terminating null.
#define O2S_MODE_NAME_LEN 24

// Deny compiler to align these structures
#pragma pack(push)
#pragma pack(1)

/// Raw stack file header.
struct RawStackHeader // 64 bytes
{
    /// Raw stack file signature, O2S_SIGNATURE.
    uint32_t signature; // 4 bytes
    /// Version of this file format, O2S_VERSION_*.
    uint16_t version; // 2 bytes
    /// Number of significant bits in pixel values.
    uint16_t bitDepth; // 2 bytes
    /// Frame width in pixels.
    uint16_t width; // 2 bytes
    /// Frame height in pixels.
    uint16_t height; // 2 bytes
    /// Number of complete frames stored in the file.
    uint32_t frameCount; // 4 bytes
    /// Size of RawStackFrameMeta as written by the producer.
    uint32_t sizeOfFrameMeta; // 4 bytes
    /// Mode the stack belongs to, numeric value of o2::Mode.
    uint8_t mode; // 1 byte
    /// Reserved, zeroed.
    uint8_t reserved1[3]; // 3 bytes
    /// Run start, seconds since Unix epoch.
    uint64_t runStartTime; // 8 bytes
    /// Mode name, null-terminated.
    char modeName[O2S_MODE_NAME_LEN]; // 24 bytes
    /// Reserved, zeroed.
    uint8_t reserved2[8]; // 8 bytes
};

/// Per-frame record stored right before pixel data.
struct RawStackFrameMeta // 24 bytes
{
    /// Frame number assigned by the camera.
    uint32_t frameNr; // 4 bytes
    /// Reserved, zeroed.
    uint32_t reserved; // 4 bytes
    /// Index of the tick that triggered the frame.
    uint64_t tickIndex; // 8 bytes
    /// Acquisition time stamp in microseconds, host steady clock.
    uint64_t timestampUs; // 8 bytes
};

#pragma pack(pop)

static_assert(sizeof(RawStackHeader) == 64, "Unexpected RawStackHeader size");
static_assert(sizeof(RawStackFrameMeta) == 24, "Unexpected RawStackFrameMeta size");

#endif /* O2_RAW_STACK_FORMAT_H */
