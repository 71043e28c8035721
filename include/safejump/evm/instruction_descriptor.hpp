#pragma once

#include <safejump/core/byte_string.hpp>
#include <safejump/core/int.hpp>
#include <safejump/core/result.hpp>
#include <safejump/evm/config.hpp>
#include <safejump/evm/opcodes.hpp>

#include <evmc/evmc.h>

#include <array>
#include <cstddef>
#include <cstdint>

SAFEJUMP_EVM_NAMESPACE_BEGIN

constexpr size_t stack_limit = 1024;

/**
 * Static stack effect and decoding metadata of one opcode. `consumes` is the
 * number of items the instruction needs on the stack and `produces` the
 * number it leaves in their place, so DUPn is (n, n + 1) and SWAPn is
 * (n + 1, n + 1).
 */
struct InstructionDescriptor
{
    char const *name = nullptr;
    uint8_t consumes = 0;
    uint8_t produces = 0;
    bool produces_constant = false;
    uint8_t immediate_len = 0;
    bool terminal = false;
    evmc_revision since = EVMC_FRONTIER;

    constexpr int stack_height_change() const noexcept
    {
        return static_cast<int>(produces) - static_cast<int>(consumes);
    }
};

static_assert(sizeof(InstructionDescriptor) == 24);
static_assert(alignof(InstructionDescriptor) == 8);

using DescriptorTable = std::array<InstructionDescriptor, 256>;

namespace detail
{
    consteval DescriptorTable make_descriptor_table()
    {
        constexpr char const *push_names[] = {
            "PUSH0",  "PUSH1",  "PUSH2",  "PUSH3",  "PUSH4",  "PUSH5",
            "PUSH6",  "PUSH7",  "PUSH8",  "PUSH9",  "PUSH10", "PUSH11",
            "PUSH12", "PUSH13", "PUSH14", "PUSH15", "PUSH16", "PUSH17",
            "PUSH18", "PUSH19", "PUSH20", "PUSH21", "PUSH22", "PUSH23",
            "PUSH24", "PUSH25", "PUSH26", "PUSH27", "PUSH28", "PUSH29",
            "PUSH30", "PUSH31", "PUSH32"};
        constexpr char const *dup_names[] = {
            "DUP1",
            "DUP2",
            "DUP3",
            "DUP4",
            "DUP5",
            "DUP6",
            "DUP7",
            "DUP8",
            "DUP9",
            "DUP10",
            "DUP11",
            "DUP12",
            "DUP13",
            "DUP14",
            "DUP15",
            "DUP16"};
        constexpr char const *swap_names[] = {
            "SWAP1",
            "SWAP2",
            "SWAP3",
            "SWAP4",
            "SWAP5",
            "SWAP6",
            "SWAP7",
            "SWAP8",
            "SWAP9",
            "SWAP10",
            "SWAP11",
            "SWAP12",
            "SWAP13",
            "SWAP14",
            "SWAP15",
            "SWAP16"};
        constexpr char const *log_names[] = {
            "LOG0", "LOG1", "LOG2", "LOG3", "LOG4"};

        DescriptorTable table{};

        auto const def = [&table](
                             uint8_t const op,
                             char const *const name,
                             uint8_t const consumes,
                             uint8_t const produces,
                             evmc_revision const since = EVMC_FRONTIER) {
            table[op] = InstructionDescriptor{
                .name = name,
                .consumes = consumes,
                .produces = produces,
                .since = since};
        };
        auto const halt = [&table](
                              uint8_t const op,
                              char const *const name,
                              uint8_t const consumes,
                              evmc_revision const since = EVMC_FRONTIER) {
            table[op] = InstructionDescriptor{
                .name = name,
                .consumes = consumes,
                .terminal = true,
                .since = since};
        };

        halt(STOP, "STOP", 0);
        def(ADD, "ADD", 2, 1);
        def(MUL, "MUL", 2, 1);
        def(SUB, "SUB", 2, 1);
        def(DIV, "DIV", 2, 1);
        def(SDIV, "SDIV", 2, 1);
        def(MOD, "MOD", 2, 1);
        def(SMOD, "SMOD", 2, 1);
        def(ADDMOD, "ADDMOD", 3, 1);
        def(MULMOD, "MULMOD", 3, 1);
        def(EXP, "EXP", 2, 1);
        def(SIGNEXTEND, "SIGNEXTEND", 2, 1);

        def(LT, "LT", 2, 1);
        def(GT, "GT", 2, 1);
        def(SLT, "SLT", 2, 1);
        def(SGT, "SGT", 2, 1);
        def(EQ, "EQ", 2, 1);
        def(ISZERO, "ISZERO", 1, 1);
        def(AND, "AND", 2, 1);
        def(OR, "OR", 2, 1);
        def(XOR, "XOR", 2, 1);
        def(NOT, "NOT", 1, 1);
        def(BYTE, "BYTE", 2, 1);
        def(SHL, "SHL", 2, 1, EVMC_CONSTANTINOPLE);
        def(SHR, "SHR", 2, 1, EVMC_CONSTANTINOPLE);
        def(SAR, "SAR", 2, 1, EVMC_CONSTANTINOPLE);

        def(KECCAK256, "KECCAK256", 2, 1);

        def(ADDRESS, "ADDRESS", 0, 1);
        def(BALANCE, "BALANCE", 1, 1);
        def(ORIGIN, "ORIGIN", 0, 1);
        def(CALLER, "CALLER", 0, 1);
        def(CALLVALUE, "CALLVALUE", 0, 1);
        def(CALLDATALOAD, "CALLDATALOAD", 1, 1);
        def(CALLDATASIZE, "CALLDATASIZE", 0, 1);
        def(CALLDATACOPY, "CALLDATACOPY", 3, 0);
        def(CODESIZE, "CODESIZE", 0, 1);
        def(CODECOPY, "CODECOPY", 3, 0);
        def(GASPRICE, "GASPRICE", 0, 1);
        def(EXTCODESIZE, "EXTCODESIZE", 1, 1);
        def(EXTCODECOPY, "EXTCODECOPY", 4, 0);
        def(RETURNDATASIZE, "RETURNDATASIZE", 0, 1, EVMC_BYZANTIUM);
        def(RETURNDATACOPY, "RETURNDATACOPY", 3, 0, EVMC_BYZANTIUM);
        def(EXTCODEHASH, "EXTCODEHASH", 1, 1, EVMC_CONSTANTINOPLE);

        def(BLOCKHASH, "BLOCKHASH", 1, 1);
        def(COINBASE, "COINBASE", 0, 1);
        def(TIMESTAMP, "TIMESTAMP", 0, 1);
        def(NUMBER, "NUMBER", 0, 1);
        def(PREVRANDAO, "PREVRANDAO", 0, 1);
        def(GASLIMIT, "GASLIMIT", 0, 1);
        def(CHAINID, "CHAINID", 0, 1, EVMC_ISTANBUL);
        def(SELFBALANCE, "SELFBALANCE", 0, 1, EVMC_ISTANBUL);
        def(BASEFEE, "BASEFEE", 0, 1, EVMC_LONDON);
        def(BLOBHASH, "BLOBHASH", 1, 1, EVMC_CANCUN);
        def(BLOBBASEFEE, "BLOBBASEFEE", 0, 1, EVMC_CANCUN);

        def(POP, "POP", 1, 0);
        def(MLOAD, "MLOAD", 1, 1);
        def(MSTORE, "MSTORE", 2, 0);
        def(MSTORE8, "MSTORE8", 2, 0);
        def(SLOAD, "SLOAD", 1, 1);
        def(SSTORE, "SSTORE", 2, 0);
        def(JUMP, "JUMP", 1, 0);
        def(JUMPI, "JUMPI", 2, 0);
        def(PC, "PC", 0, 1);
        def(MSIZE, "MSIZE", 0, 1);
        def(GAS, "GAS", 0, 1);
        def(JUMPDEST, "JUMPDEST", 0, 0);
        def(TLOAD, "TLOAD", 1, 1, EVMC_CANCUN);
        def(TSTORE, "TSTORE", 2, 0, EVMC_CANCUN);
        def(MCOPY, "MCOPY", 3, 0, EVMC_CANCUN);

        for (uint8_t n = 0; n <= 32; ++n) {
            table[PUSH0 + n] = InstructionDescriptor{
                .name = push_names[n],
                .consumes = 0,
                .produces = 1,
                .produces_constant = true,
                .immediate_len = n,
                .since = n == 0 ? EVMC_SHANGHAI : EVMC_FRONTIER};
        }
        for (uint8_t n = 1; n <= 16; ++n) {
            def(static_cast<uint8_t>(DUP1 + n - 1),
                dup_names[n - 1],
                n,
                static_cast<uint8_t>(n + 1));
            def(static_cast<uint8_t>(SWAP1 + n - 1),
                swap_names[n - 1],
                static_cast<uint8_t>(n + 1),
                static_cast<uint8_t>(n + 1));
        }
        for (uint8_t n = 0; n <= 4; ++n) {
            def(static_cast<uint8_t>(LOG0 + n),
                log_names[n],
                static_cast<uint8_t>(n + 2),
                0);
        }

        def(CREATE, "CREATE", 3, 1);
        def(CALL, "CALL", 7, 1);
        def(CALLCODE, "CALLCODE", 7, 1);
        halt(RETURN, "RETURN", 2);
        def(DELEGATECALL, "DELEGATECALL", 6, 1, EVMC_HOMESTEAD);
        def(CREATE2, "CREATE2", 4, 1, EVMC_CONSTANTINOPLE);
        def(STATICCALL, "STATICCALL", 6, 1, EVMC_BYZANTIUM);
        halt(REVERT, "REVERT", 2, EVMC_BYZANTIUM);
        halt(SELFDESTRUCT, "SELFDESTRUCT", 1);

        // INVALID (0xfe) stays undefined: executing it is an exceptional halt

        return table;
    }
}

inline constexpr DescriptorTable descriptor_table =
    detail::make_descriptor_table();

/**
 * @return the descriptor of `opcode`, or ValidationError::InvalidInstruction
 * if the byte does not name an instruction at revision `rev`
 */
Result<InstructionDescriptor const *>
lookup(uint8_t opcode, evmc_revision rev) noexcept;

constexpr size_t
advance(size_t const pc, InstructionDescriptor const &descriptor) noexcept
{
    return pc + 1 + descriptor.immediate_len;
}

/**
 * Decode the big-endian literal that follows the constant-producing
 * instruction at `pc`.
 * @return ValidationError::CodeTruncated if the immediate data runs past the
 * end of `code`
 */
Result<uint256_t> immediate_value(
    byte_string_view code, size_t pc, InstructionDescriptor const &descriptor);

char const *opcode_name(uint8_t opcode) noexcept;

SAFEJUMP_EVM_NAMESPACE_END
