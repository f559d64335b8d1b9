#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Base class of every error raised by the overlay library.
 */
class OverlayError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/// Query for an id that was never registered nor persisted.
class NotFoundError : public OverlayError
{
public:
    using OverlayError::OverlayError;
};

/// Malformed durable entry. Recovered per entry by GeometryStore::load().
class CorruptStoreError : public OverlayError
{
public:
    using OverlayError::OverlayError;
};

/// A second OverlayManager tried to take the process-wide event loop.
class AlreadyRunningError : public OverlayError
{
public:
    using OverlayError::OverlayError;
};

/// Non-positive width/height supplied explicitly.
class InvalidGeometryError : public OverlayError
{
public:
    using OverlayError::OverlayError;
};

/// Recognized style option with a bad value, or unknown option under the strict policy.
class InvalidStyleError : public OverlayError
{
public:
    using OverlayError::OverlayError;
};

/// The store could not be flushed to disk.
class StoreWriteError : public OverlayError
{
public:
    using OverlayError::OverlayError;
};

/// Operation on a manager whose loop was already stopped by destroy().
class LoopStoppedError : public OverlayError
{
public:
    using OverlayError::OverlayError;
};
