// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <restake/core/byte_string.hpp>
#include <restake/core/bytes.hpp>
#include <restake/core/int.hpp>
#include <restake/core/likely.h>
#include <restake/execution/core/address.hpp>
#include <restake/execution/core/contract/abi_decode.hpp>
#include <restake/execution/core/contract/abi_encode.hpp>
#include <restake/execution/core/contract/abi_signatures.hpp>
#include <restake/execution/core/contract/amount_math.hpp>
#include <restake/execution/core/contract/events.hpp>
#include <restake/execution/core/fmt/address_fmt.hpp>
#include <restake/execution/core/fmt/int_fmt.hpp>
#include <restake/execution/state/state.hpp>
#include <restake/execution/vault/liquid_delegation_vault.hpp>
#include <restake/execution/vault/vault_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <evmc/evmc.h>

#include <intx/intx.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <span>
#include <utility>
#include <vector>

RESTAKE_VAULT_ANONYMOUS_NAMESPACE_BEGIN

////////////////////////
// Function Selectors //
////////////////////////

struct PrecompileSelector
{
    static constexpr uint32_t SCHEDULE_UNSTAKE =
        abi_encode_selector("scheduleUnstake(uint256)");
    static constexpr uint32_t CANCEL_UNSTAKE =
        abi_encode_selector("cancelUnstake()");
    static constexpr uint32_t SCHEDULE_WITHDRAW =
        abi_encode_selector("scheduleWithdraw(uint256)");
    static constexpr uint32_t CANCEL_WITHDRAW_AND_REDELEGATE =
        abi_encode_selector("cancelWithdrawAndRedelegate()");
    static constexpr uint32_t GET_UNSTAKE_REQUEST =
        abi_encode_selector("getUnstakeRequest(address)");
    static constexpr uint32_t GET_WITHDRAW_REQUEST =
        abi_encode_selector("getWithdrawRequest(address)");
    static constexpr uint32_t GET_CONFIG = abi_encode_selector("getConfig()");
};

static_assert(PrecompileSelector::SCHEDULE_UNSTAKE == 0x106d08df);
static_assert(PrecompileSelector::CANCEL_UNSTAKE == 0x4ab17969);
static_assert(PrecompileSelector::SCHEDULE_WITHDRAW == 0xcce9d801);
static_assert(PrecompileSelector::CANCEL_WITHDRAW_AND_REDELEGATE == 0xc2498095);
static_assert(PrecompileSelector::GET_UNSTAKE_REQUEST == 0x64a6c194);
static_assert(PrecompileSelector::GET_WITHDRAW_REQUEST == 0x2ccae896);
static_assert(PrecompileSelector::GET_CONFIG == 0xc3f909d4);

///////////////
// Gas Costs //
///////////////

// The gas of each entry point is determined by its storage accesses, the
// events it emits and the gateway calls it places:
//
// gas = SLOAD_COST * sloads + SSTORE_COST * sstores +
//       EVENT_COST * events + GATEWAY_CALL_COST * gateway_calls

constexpr uint64_t SLOAD = 2100;
constexpr uint64_t SSTORE = 2900;
constexpr uint64_t EVENT_COSTS = 4275;
constexpr uint64_t GATEWAY_CALL_COSTS = 11800;

struct OpCount
{
    uint64_t sloads;
    uint64_t sstores;
    uint64_t events;
    uint64_t gateway_calls;
};

constexpr uint64_t compute_costs(OpCount const &ops)
{
    return SLOAD * ops.sloads + SSTORE * ops.sstores +
           EVENT_COSTS * ops.events + GATEWAY_CALL_COSTS * ops.gateway_calls;
}

// request structs span two slots
constexpr uint64_t SCHEDULE_UNSTAKE_OP_COST = compute_costs(
    OpCount{.sloads = 3, .sstores = 2, .events = 1, .gateway_calls = 1});
constexpr uint64_t CANCEL_UNSTAKE_OP_COST = compute_costs(
    OpCount{.sloads = 2, .sstores = 2, .events = 1, .gateway_calls = 1});
constexpr uint64_t SCHEDULE_WITHDRAW_OP_COST = compute_costs(
    OpCount{.sloads = 2, .sstores = 4, .events = 1, .gateway_calls = 1});
constexpr uint64_t CANCEL_WITHDRAW_AND_REDELEGATE_OP_COST = compute_costs(
    OpCount{.sloads = 2, .sstores = 2, .events = 2, .gateway_calls = 2});
constexpr uint64_t GET_REQUEST_OP_COST = compute_costs(
    OpCount{.sloads = 2, .sstores = 0, .events = 0, .gateway_calls = 0});
constexpr uint64_t GET_CONFIG_OP_COST = 200;

static_assert(SCHEDULE_UNSTAKE_OP_COST == 28175);
static_assert(CANCEL_UNSTAKE_OP_COST == 26075);
static_assert(SCHEDULE_WITHDRAW_OP_COST == 31875);
static_assert(CANCEL_WITHDRAW_AND_REDELEGATE_OP_COST == 42150);
static_assert(GET_REQUEST_OP_COST == 4200);

Result<void> function_not_payable(evmc_uint256be const &value)
{
    bool const all_zero = std::all_of(
        value.bytes,
        value.bytes + sizeof(evmc_uint256be),
        [](uint8_t const byte) { return byte == 0; });

    if (RESTAKE_UNLIKELY(!all_zero)) {
        return VaultError::ValueNonZero;
    }
    return outcome::success();
}

RESTAKE_VAULT_ANONYMOUS_NAMESPACE_END

RESTAKE_VAULT_NAMESPACE_BEGIN

LiquidDelegationVault::LiquidDelegationVault(
    State &state, delegation::DelegationGateway &gateway,
    VaultAccounting const &accounting, VaultConfig config,
    BlockHeader const &header)
    : state_{state}
    , gateway_{gateway}
    , accounting_{accounting}
    , config_{std::move(config)}
    , header_{header}
    , vars{state}
{
}

/////////////
// Events //
/////////////
void LiquidDelegationVault::emit_unstake_scheduled_event(
    Address const &depositor, u256_be const &amount, u64_be const timestamp)
{
    constexpr bytes32_t signature = abi_encode_event_signature(
        "UnstakeScheduled(address,uint256,uint64)");
    static_assert(
        signature ==
        0xbc38323a3bc31060bc16285644bb2ed7442fd6ff5bc548b3497729b2a2473be1_bytes32);

    auto const event = EventBuilder(VAULT_CA, signature)
                           .indexed(depositor)
                           .data(amount)
                           .data(timestamp)
                           .build();
    emit_log(event);
}

void LiquidDelegationVault::emit_unstake_cancelled_event(
    Address const &depositor, u256_be const &amount)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("UnstakeCancelled(address,uint256)");
    static_assert(
        signature ==
        0x02fbe69eb5474cc010b6c0c236dd70755556cee48c19373e79147100e04de70b_bytes32);

    auto const event = EventBuilder(VAULT_CA, signature)
                           .indexed(depositor)
                           .data(amount)
                           .build();
    emit_log(event);
}

void LiquidDelegationVault::emit_unstake_executed_event(
    Address const &depositor, u256_be const &amount)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("UnstakeExecuted(address,uint256)");
    static_assert(
        signature ==
        0xe3e01bae44eb85a30bd61c3742b60e379576ff5070a142675f575f53d5bbc2e4_bytes32);

    auto const event = EventBuilder(VAULT_CA, signature)
                           .indexed(depositor)
                           .data(amount)
                           .build();
    emit_log(event);
}

void LiquidDelegationVault::emit_withdraw_scheduled_event(
    Address const &depositor, u256_be const &amount, u64_be const timestamp)
{
    constexpr bytes32_t signature = abi_encode_event_signature(
        "WithdrawScheduled(address,uint256,uint64)");
    static_assert(
        signature ==
        0xb92926f2aeb816003c531a514d19de0c35f8ed90fedb0e8418d7aefdfc3ed109_bytes32);

    auto const event = EventBuilder(VAULT_CA, signature)
                           .indexed(depositor)
                           .data(amount)
                           .data(timestamp)
                           .build();
    emit_log(event);
}

void LiquidDelegationVault::emit_withdraw_cancelled_event(
    Address const &depositor, u256_be const &amount)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("WithdrawCancelled(address,uint256)");
    static_assert(
        signature ==
        0x6cf22392efcef3d14b6c4d51fdcdc5c24f8bacbdecf5dcefa057cffdbce53f72_bytes32);

    auto const event = EventBuilder(VAULT_CA, signature)
                           .indexed(depositor)
                           .data(amount)
                           .build();
    emit_log(event);
}

void LiquidDelegationVault::emit_assets_delegated_event(
    Address const &depositor, u256_be const &amount)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("AssetsDelegated(address,uint256)");
    static_assert(
        signature ==
        0x6a592b05b12b5d2ece8261deaa2bd7c6937fd9ef3e7e0f1ce4912881a9d43bbd_bytes32);

    auto const event = EventBuilder(VAULT_CA, signature)
                           .indexed(depositor)
                           .data(amount)
                           .build();
    emit_log(event);
}

void LiquidDelegationVault::emit_log(Receipt::Log const &log)
{
    state_.store_log(log);
}

/////////////
// Getters //
/////////////
std::optional<UnstakeRequest>
LiquidDelegationVault::get_unstake_request(Address const &depositor) const
{
    return vars.unstake_request(depositor).load_checked();
}

std::optional<WithdrawRequest>
LiquidDelegationVault::get_withdraw_request(Address const &depositor) const
{
    return vars.withdraw_request(depositor).load_checked();
}

//////////////////////////
// Depositor operations //
//////////////////////////
Result<void> LiquidDelegationVault::schedule_unstake(
    Address const &depositor, uint256_t const &amount)
{
    if (RESTAKE_UNLIKELY(amount == 0)) {
        return VaultError::InvalidAmount;
    }

    auto request_storage = vars.unstake_request(depositor);
    auto const prior = request_storage.load_checked();
    // an executed unstake is held by the gateway until it is withdrawn
    if (RESTAKE_UNLIKELY(
            prior.has_value() && prior->state != UnstakeState::Scheduled)) {
        return VaultError::InvalidUnstakeState;
    }

    // the claimable balance must cover everything the depositor is already
    // unwinding, not only the new request
    uint256_t const withdrawing =
        get_withdraw_request(depositor)
            .transform([](WithdrawRequest const &r) { return r.amount.native(); })
            .value_or(0);
    BOOST_OUTCOME_TRY(auto const total, checked_add(amount, withdrawing));
    if (RESTAKE_UNLIKELY(total > accounting_.max_withdraw(depositor))) {
        return VaultError::ExceedsClaimableBalance;
    }

    if (prior.has_value()) {
        BOOST_OUTCOME_TRYV(gateway_.cancel_unstake(
            VAULT_CA, config_.op, config_.asset, prior->amount.native()));
    }
    BOOST_OUTCOME_TRYV(gateway_.schedule_unstake(
        VAULT_CA, config_.op, config_.asset, amount));

    u64_be const timestamp = header_.timestamp;
    request_storage.store(UnstakeRequest{
        .amount = amount,
        .timestamp = timestamp,
        .state = UnstakeState::Scheduled});

    if (prior.has_value()) {
        emit_unstake_cancelled_event(depositor, prior->amount);
    }
    emit_unstake_scheduled_event(depositor, amount, timestamp);
    return outcome::success();
}

Result<void> LiquidDelegationVault::cancel_unstake(Address const &depositor)
{
    auto request_storage = vars.unstake_request(depositor);
    auto const request = request_storage.load_checked();
    if (RESTAKE_UNLIKELY(
            !request.has_value() ||
            request->state != UnstakeState::Scheduled)) {
        return VaultError::NoScheduledUnstake;
    }

    BOOST_OUTCOME_TRYV(gateway_.cancel_unstake(
        VAULT_CA, config_.op, config_.asset, request->amount.native()));

    request_storage.clear();

    emit_unstake_cancelled_event(depositor, request->amount);
    return outcome::success();
}

Result<void> LiquidDelegationVault::schedule_withdraw(
    Address const &depositor, uint256_t const &amount)
{
    auto unstake_storage = vars.unstake_request(depositor);
    auto const unstake = unstake_storage.load_checked();
    if (RESTAKE_UNLIKELY(
            !unstake.has_value() || unstake->state != UnstakeState::Executed)) {
        return VaultError::InvalidUnstakeState;
    }
    if (RESTAKE_UNLIKELY(amount == 0)) {
        return VaultError::InvalidAmount;
    }
    uint256_t const unstaked = unstake->amount.native();
    if (RESTAKE_UNLIKELY(amount > unstaked)) {
        return VaultError::ExceedsUnstakeAmount;
    }

    auto withdraw_storage = vars.withdraw_request(depositor);
    if (auto const prior = withdraw_storage.load_checked();
        prior.has_value()) {
        BOOST_OUTCOME_TRYV(
            redelegate_withdraw(depositor, prior->amount.native()));
    }
    BOOST_OUTCOME_TRYV(
        gateway_.schedule_withdraw(VAULT_CA, config_.asset, amount));

    u64_be const timestamp = header_.timestamp;
    withdraw_storage.store(WithdrawRequest{
        .amount = amount,
        .timestamp = timestamp,
        .state = WithdrawState::Scheduled});

    if (amount == unstaked) {
        unstake_storage.clear();
    }
    else {
        auto remaining = *unstake;
        remaining.amount = unstaked - amount;
        unstake_storage.store(remaining);
    }

    emit_withdraw_scheduled_event(depositor, amount, timestamp);
    return outcome::success();
}

Result<void>
LiquidDelegationVault::cancel_withdraw_and_redelegate(Address const &depositor)
{
    auto request_storage = vars.withdraw_request(depositor);
    auto const request = request_storage.load_checked();
    if (RESTAKE_UNLIKELY(
            !request.has_value() ||
            request->state != WithdrawState::Scheduled)) {
        return VaultError::NoScheduledWithdraw;
    }
    BOOST_OUTCOME_TRYV(
        redelegate_withdraw(depositor, request->amount.native()));

    request_storage.clear();
    return outcome::success();
}

Result<void> LiquidDelegationVault::redelegate_withdraw(
    Address const &depositor, uint256_t const &amount)
{
    BOOST_OUTCOME_TRYV(
        gateway_.cancel_withdraw(VAULT_CA, config_.asset, amount));

    auto const res = gateway_.delegate(
        VAULT_CA,
        config_.op,
        config_.asset,
        amount,
        std::span<uint64_t const>{config_.blueprint_selection});
    if (RESTAKE_UNLIKELY(res.has_error())) {
        // The withdraw is no longer pending at the gateway. Whether that
        // sticks depends on the caller rejecting this operation.
        LOG_ERROR(
            "LiquidDelegationVault: redelegation of {} for {} failed after "
            "the withdraw was cancelled: {}",
            amount,
            depositor,
            res.assume_error().message().c_str());
        return VaultError::DelegationNotPossible;
    }

    emit_withdraw_cancelled_event(depositor, amount);
    emit_assets_delegated_event(depositor, amount);
    return outcome::success();
}

///////////////////////////
// External vault hooks  //
///////////////////////////
Result<void> LiquidDelegationVault::on_deposit(
    Address const &depositor, uint256_t const &amount)
{
    if (RESTAKE_UNLIKELY(amount == 0)) {
        return VaultError::InvalidAmount;
    }

    auto const res = gateway_.delegate(
        VAULT_CA,
        config_.op,
        config_.asset,
        amount,
        std::span<uint64_t const>{config_.blueprint_selection});
    if (RESTAKE_UNLIKELY(res.has_error())) {
        LOG_WARNING(
            "LiquidDelegationVault: delegation of {} deposited by {} failed: "
            "{}",
            amount,
            depositor,
            res.assume_error().message().c_str());
        return VaultError::DelegationFailed;
    }

    emit_assets_delegated_event(depositor, amount);
    return outcome::success();
}

Result<void> LiquidDelegationVault::on_withdraw(
    Address const &owner, uint256_t const &amount)
{
    if (RESTAKE_UNLIKELY(amount == 0)) {
        return VaultError::InvalidAmount;
    }

    auto request_storage = vars.withdraw_request(owner);
    auto request = request_storage.load_checked();
    if (RESTAKE_UNLIKELY(
            !request.has_value() ||
            request->state != WithdrawState::Scheduled)) {
        return VaultError::NoScheduledWithdraw;
    }
    uint256_t const scheduled = request->amount.native();
    if (RESTAKE_UNLIKELY(amount > scheduled)) {
        return VaultError::ExceedsWithdrawAmount;
    }

    BOOST_OUTCOME_TRYV(gateway_.execute_withdraw(VAULT_CA));

    if (amount == scheduled) {
        request_storage.clear();
    }
    else {
        request->amount = scheduled - amount;
        request_storage.store(*request);
    }

    LOG_DEBUG(
        "LiquidDelegationVault: {} withdrew {} of {} scheduled",
        owner,
        amount,
        scheduled);

    return outcome::success();
}

////////////////////
//  System Calls  //
////////////////////
Result<void>
LiquidDelegationVault::syscall_unstake_executed(Address const &depositor)
{
    auto request_storage = vars.unstake_request(depositor);
    auto request = request_storage.load_checked();
    if (RESTAKE_UNLIKELY(!request.has_value())) {
        return VaultError::NoScheduledUnstake;
    }
    if (RESTAKE_UNLIKELY(request->state != UnstakeState::Scheduled)) {
        return VaultError::InvalidUnstakeState;
    }

    request->state = UnstakeState::Executed;
    request_storage.store(*request);

    emit_unstake_executed_event(depositor, request->amount);
    return outcome::success();
}

/////////////////
// Precompiles //
/////////////////
std::pair<LiquidDelegationVault::PrecompileFunc, uint64_t>
LiquidDelegationVault::precompile_dispatch(byte_string_view &input)
{
    if (RESTAKE_UNLIKELY(input.size() < 4)) {
        return std::make_pair(&LiquidDelegationVault::precompile_fallback, 40000);
    }

    auto const signature =
        intx::be::unsafe::load<uint32_t>(input.substr(0, 4).data());
    input.remove_prefix(4);

    switch (signature) {
    case PrecompileSelector::SCHEDULE_UNSTAKE:
        return {
            &LiquidDelegationVault::precompile_schedule_unstake,
            SCHEDULE_UNSTAKE_OP_COST};
    case PrecompileSelector::CANCEL_UNSTAKE:
        return {
            &LiquidDelegationVault::precompile_cancel_unstake,
            CANCEL_UNSTAKE_OP_COST};
    case PrecompileSelector::SCHEDULE_WITHDRAW:
        return {
            &LiquidDelegationVault::precompile_schedule_withdraw,
            SCHEDULE_WITHDRAW_OP_COST};
    case PrecompileSelector::CANCEL_WITHDRAW_AND_REDELEGATE:
        return {
            &LiquidDelegationVault::precompile_cancel_withdraw_and_redelegate,
            CANCEL_WITHDRAW_AND_REDELEGATE_OP_COST};
    case PrecompileSelector::GET_UNSTAKE_REQUEST:
        return {
            &LiquidDelegationVault::precompile_get_unstake_request,
            GET_REQUEST_OP_COST};
    case PrecompileSelector::GET_WITHDRAW_REQUEST:
        return {
            &LiquidDelegationVault::precompile_get_withdraw_request,
            GET_REQUEST_OP_COST};
    case PrecompileSelector::GET_CONFIG:
        return {
            &LiquidDelegationVault::precompile_get_config, GET_CONFIG_OP_COST};
    default:
        return {&LiquidDelegationVault::precompile_fallback, 40000};
    }
}

Result<byte_string> LiquidDelegationVault::precompile_schedule_unstake(
    byte_string_view input, evmc_address const &msg_sender,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));

    BOOST_OUTCOME_TRY(auto const amount, abi_decode_fixed<u256_be>(input));
    if (RESTAKE_UNLIKELY(!input.empty())) {
        return VaultError::InvalidInput;
    }

    BOOST_OUTCOME_TRY(schedule_unstake(msg_sender, amount.native()));
    return byte_string{abi_encode_bool(true)};
}

Result<byte_string> LiquidDelegationVault::precompile_cancel_unstake(
    byte_string_view const input, evmc_address const &msg_sender,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));

    if (RESTAKE_UNLIKELY(!input.empty())) {
        return VaultError::InvalidInput;
    }

    BOOST_OUTCOME_TRY(cancel_unstake(msg_sender));
    return byte_string{abi_encode_bool(true)};
}

Result<byte_string> LiquidDelegationVault::precompile_schedule_withdraw(
    byte_string_view input, evmc_address const &msg_sender,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));

    BOOST_OUTCOME_TRY(auto const amount, abi_decode_fixed<u256_be>(input));
    if (RESTAKE_UNLIKELY(!input.empty())) {
        return VaultError::InvalidInput;
    }

    BOOST_OUTCOME_TRY(schedule_withdraw(msg_sender, amount.native()));
    return byte_string{abi_encode_bool(true)};
}

Result<byte_string>
LiquidDelegationVault::precompile_cancel_withdraw_and_redelegate(
    byte_string_view const input, evmc_address const &msg_sender,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));

    if (RESTAKE_UNLIKELY(!input.empty())) {
        return VaultError::InvalidInput;
    }

    BOOST_OUTCOME_TRY(cancel_withdraw_and_redelegate(msg_sender));
    return byte_string{abi_encode_bool(true)};
}

Result<byte_string> LiquidDelegationVault::precompile_get_unstake_request(
    byte_string_view input, evmc_address const &,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));

    BOOST_OUTCOME_TRY(auto const depositor, abi_decode_fixed<Address>(input));
    if (RESTAKE_UNLIKELY(!input.empty())) {
        return VaultError::InvalidInput;
    }

    auto const request = vars.unstake_request(depositor).load();

    AbiEncoder encoder;
    encoder.add_uint(request.amount);
    encoder.add_uint(request.timestamp);
    encoder.add_uint(u8_be{static_cast<uint8_t>(request.state)});
    return encoder.encode_final();
}

Result<byte_string> LiquidDelegationVault::precompile_get_withdraw_request(
    byte_string_view input, evmc_address const &,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));

    BOOST_OUTCOME_TRY(auto const depositor, abi_decode_fixed<Address>(input));
    if (RESTAKE_UNLIKELY(!input.empty())) {
        return VaultError::InvalidInput;
    }

    auto const request = vars.withdraw_request(depositor).load();

    AbiEncoder encoder;
    encoder.add_uint(request.amount);
    encoder.add_uint(request.timestamp);
    encoder.add_uint(u8_be{static_cast<uint8_t>(request.state)});
    return encoder.encode_final();
}

// returns (bytes32 operator, uint8 assetKind, address token,
//          uint64[] blueprintSelection)
Result<byte_string> LiquidDelegationVault::precompile_get_config(
    byte_string_view const input, evmc_address const &,
    evmc_uint256be const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(msg_value));

    if (RESTAKE_UNLIKELY(!input.empty())) {
        return VaultError::InvalidInput;
    }

    std::vector<u64_be> selection;
    selection.reserve(config_.blueprint_selection.size());
    for (auto const id : config_.blueprint_selection) {
        selection.emplace_back(id);
    }

    AbiEncoder encoder;
    encoder.add_bytes32(config_.op);
    encoder.add_uint(u8_be{static_cast<uint8_t>(config_.asset.kind)});
    encoder.add_address(config_.asset.token);
    encoder.add_uint_array(std::span<u64_be const>{selection});
    return encoder.encode_final();
}

Result<byte_string> LiquidDelegationVault::precompile_fallback(
    byte_string_view const, evmc_address const &, evmc_uint256be const &)
{
    return VaultError::MethodNotSupported;
}

RESTAKE_VAULT_NAMESPACE_END
