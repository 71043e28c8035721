#include <safejump/core/byte_string.hpp>
#include <safejump/evm/code.hpp>
#include <safejump/evm/opcodes.hpp>
#include <safejump/validation_error.hpp>

#include <evmc/evmc.h>

#include <gtest/gtest.h>

using namespace safejump;
using namespace safejump::evm;

TEST(Code, jump_dests)
{
    byte_string const bytes{JUMPDEST, PUSH1, 0x00, JUMPDEST, STOP, JUMPDEST};
    Code const code{bytes};

    EXPECT_EQ(code.size(), 6);
    EXPECT_TRUE(code.is_jump_dest(0));
    EXPECT_FALSE(code.is_jump_dest(1));
    EXPECT_TRUE(code.is_jump_dest(3));
    EXPECT_FALSE(code.is_jump_dest(4));
    EXPECT_TRUE(code.is_jump_dest(5));
    EXPECT_EQ(code.jump_dest_count(), 3);
}

TEST(Code, jump_dest_inside_push_data)
{
    byte_string const bytes{PUSH2, JUMPDEST, JUMPDEST, JUMPDEST};
    Code const code{bytes};

    EXPECT_FALSE(code.is_jump_dest(1));
    EXPECT_FALSE(code.is_jump_dest(2));
    EXPECT_TRUE(code.is_jump_dest(3));
    EXPECT_EQ(code.jump_dest_count(), 1);
}

TEST(Code, truncated_push_data)
{
    byte_string const bytes{JUMPDEST, PUSH4, JUMPDEST};
    Code const code{bytes};

    EXPECT_TRUE(code.is_jump_dest(0));
    EXPECT_FALSE(code.is_jump_dest(2));
}

TEST(Code, out_of_range)
{
    Code const code{byte_string{JUMPDEST}};

    EXPECT_TRUE(code.is_jump_dest(0));
    EXPECT_FALSE(code.is_jump_dest(1));
    EXPECT_FALSE(code.is_jump_dest(1'000'000));
}

TEST(Code, empty)
{
    Code const code{byte_string{}};

    EXPECT_EQ(code.size(), 0);
    EXPECT_EQ(code.jump_dest_count(), 0);
    EXPECT_EQ(code.revision(), default_revision);
}

TEST(Code, instruction_at)
{
    byte_string const bytes{PUSH0, ADD};

    Code const shanghai{bytes, EVMC_SHANGHAI};
    EXPECT_FALSE(shanghai.instruction_at(0).has_error());
    EXPECT_EQ(shanghai.at(1), ADD);

    Code const paris{bytes, EVMC_PARIS};
    auto const res = paris.instruction_at(0);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ValidationError::InvalidInstruction);
}
