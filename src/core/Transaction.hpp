#pragma once

#include "ConfigAssembler.hpp"

#include <cstdint>
#include <expected>
#include <string>

class CSnapshotSlot;
class IVerifier;

enum eTransactionState : uint8_t {
    TXN_IDLE = 0,
    TXN_BACKED_UP,
    TXN_APPLIED,
    TXN_ACCEPTED,
    TXN_ROLLED_BACK,
};

enum eTransactionError : uint8_t {
    TXN_ERR_BUSY = 0,
    TXN_ERR_BACKUP,
    TXN_ERR_MISSING_RESOURCE,
    TXN_ERR_IO,
    TXN_ERR_VERIFICATION,
    TXN_ERR_BAD_STATE,
    TXN_ERR_ROLLBACK,
};

struct STransactionError {
    eTransactionError type = TXN_ERR_BAD_STATE;
    std::string       message;
};

/*
    backup -> apply -> verify -> accept | rollback

    apply() may run more than once under the same snapshot, so a multi step
    test always rolls back to what was there before the first step.
    The master is only ever written by accept().
    A transaction that goes out of scope while backed up or applied rolls back.
*/
class CTransaction {
  public:
    CTransaction(CSnapshotSlot& slot, const CConfigAssembler& assembler);
    ~CTransaction();

    CTransaction(const CTransaction&) = delete;
    CTransaction(CTransaction&)       = delete;
    CTransaction(CTransaction&&)      = delete;

    std::expected<void, STransactionError> begin();
    std::expected<void, STransactionError> apply(const SAssemblyPlan& plan);
    std::expected<void, STransactionError> verify(IVerifier& verifier);
    std::expected<void, STransactionError> accept();
    std::expected<void, STransactionError> rollback();

    // true while a rollback would still do something
    bool                                   pending() const;
    eTransactionState                      state() const;

  private:
    // restores, drops the lock, and wraps `cause` with any restore failure
    STransactionError  fail(STransactionError cause);
    void               finish(eTransactionState state);

    CSnapshotSlot&          m_slot;
    const CConfigAssembler& m_assembler;
    eTransactionState       m_state = TXN_IDLE;
};

const char* transactionStateToString(eTransactionState state);
