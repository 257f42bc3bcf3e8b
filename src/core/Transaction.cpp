#include "Transaction.hpp"
#include "SnapshotSlot.hpp"
#include "Verifier.hpp"
#include "../helpers/fs/FsUtils.hpp"
#include "../debug/log/Logger.hpp"

#include <format>

const char* transactionStateToString(eTransactionState state) {
    switch (state) {
        case TXN_IDLE: return "idle";
        case TXN_BACKED_UP: return "backed up";
        case TXN_APPLIED: return "applied";
        case TXN_ACCEPTED: return "accepted";
        case TXN_ROLLED_BACK: return "rolled back";
    }

    return "?";
}

CTransaction::CTransaction(CSnapshotSlot& slot, const CConfigAssembler& assembler) : m_slot(slot), m_assembler(assembler) {
    ;
}

CTransaction::~CTransaction() {
    if (!pending())
        return;

    Log::logger->log(Log::WARN, "Transaction: dropped while {}, rolling back", transactionStateToString(m_state));

    if (auto ret = rollback(); !ret)
        Log::logger->log(Log::CRIT, "Transaction: rollback on destruction failed: {}", ret.error().message);
}

bool CTransaction::pending() const {
    return m_state == TXN_BACKED_UP || m_state == TXN_APPLIED;
}

eTransactionState CTransaction::state() const {
    return m_state;
}

void CTransaction::finish(eTransactionState state) {
    m_state = state;
    m_slot.unlock();
}

STransactionError CTransaction::fail(STransactionError cause) {
    Log::logger->log(Log::ERR, "Transaction: {}, rolling back", cause.message);

    auto ret = m_slot.restore();
    finish(TXN_ROLLED_BACK);

    if (!ret) {
        Log::logger->log(Log::CRIT, "Transaction: rollback failed: {}", ret.error());
        cause.message += std::format(" (rollback failed too: {})", ret.error());
    }

    return cause;
}

std::expected<void, STransactionError> CTransaction::begin() {
    if (m_state != TXN_IDLE)
        return std::unexpected(STransactionError{TXN_ERR_BAD_STATE, std::format("can't begin a transaction that is {}", transactionStateToString(m_state))});

    if (auto ret = m_slot.lock(); !ret)
        return std::unexpected(STransactionError{TXN_ERR_BUSY, ret.error()});

    // nothing has been touched yet, so a failure here just bails
    if (auto ret = m_slot.snapshot(); !ret) {
        m_slot.unlock();
        return std::unexpected(STransactionError{TXN_ERR_BACKUP, ret.error()});
    }

    m_state = TXN_BACKED_UP;
    return {};
}

std::expected<void, STransactionError> CTransaction::apply(const SAssemblyPlan& plan) {
    if (!pending())
        return std::unexpected(STransactionError{TXN_ERR_BAD_STATE, std::format("can't apply in a transaction that is {}", transactionStateToString(m_state))});

    const auto CONTENT = m_assembler.assemble(plan);
    if (!CONTENT)
        return std::unexpected(fail({TXN_ERR_MISSING_RESOURCE, CONTENT.error().message}));

    if (auto ret = NFsUtils::writeToFile(m_slot.paths().active, *CONTENT); !ret)
        return std::unexpected(fail({TXN_ERR_IO, ret.error()}));

    m_state = TXN_APPLIED;
    return {};
}

std::expected<void, STransactionError> CTransaction::verify(IVerifier& verifier) {
    if (m_state != TXN_APPLIED)
        return std::unexpected(STransactionError{TXN_ERR_BAD_STATE, std::format("can't verify a transaction that is {}", transactionStateToString(m_state))});

    const auto REPORT = verifier.verify();
    if (REPORT.result != VERIFY_OK)
        return std::unexpected(fail({TXN_ERR_VERIFICATION, std::format("verification {}: {}", verifyResultToString(REPORT.result), REPORT.message)}));

    Log::logger->log(Log::DEBUG, "Transaction: verified, {}", REPORT.message);

    return {};
}

std::expected<void, STransactionError> CTransaction::accept() {
    if (m_state != TXN_APPLIED)
        return std::unexpected(STransactionError{TXN_ERR_BAD_STATE, std::format("can't accept a transaction that is {}", transactionStateToString(m_state))});

    const auto APPLIED = NFsUtils::readFileAsString(m_slot.paths().active);
    if (!APPLIED)
        return std::unexpected(fail({TXN_ERR_IO, std::format("couldn't read back {}", m_slot.paths().active)}));

    if (auto ret = NFsUtils::writeToFile(m_slot.paths().master, *APPLIED); !ret)
        return std::unexpected(fail({TXN_ERR_IO, ret.error()}));

    finish(TXN_ACCEPTED);
    return {};
}

std::expected<void, STransactionError> CTransaction::rollback() {
    if (!pending())
        return std::unexpected(STransactionError{TXN_ERR_BAD_STATE, std::format("can't roll back a transaction that is {}", transactionStateToString(m_state))});

    auto ret = m_slot.restore();
    finish(TXN_ROLLED_BACK);

    if (!ret)
        return std::unexpected(STransactionError{TXN_ERR_ROLLBACK, ret.error()});

    return {};
}
