#pragma once

namespace brstitch::interrupt {

// Routes SIGINT and SIGTERM to a pending-interrupt flag instead of terminating,
// so long split and stitch loops can clean up before exiting.
void InstallHandlers();

void Request() noexcept;
bool Pending() noexcept;
void Clear() noexcept;

// Throws OperationInterrupted if an interrupt is pending.
void ThrowIfPending();

}  // namespace brstitch::interrupt
