#include <gtest/gtest.h>

#include "core/errors.hpp"
#include "environment/dependency_policy.hpp"

using codebox::SecurityError;
using codebox::environment::DependencyPolicy;

// NOLINTNEXTLINE
TEST(dependency_policy, accepts_package_specifiers) {
    DependencyPolicy policy;
    EXPECT_NO_THROW(policy.Validate("pytest"));
    EXPECT_NO_THROW(policy.Validate("requests==2.31.0"));
    EXPECT_NO_THROW(policy.Validate("Django>=4.2,<5"));
    EXPECT_NO_THROW(policy.Validate("numpy~=1.26"));
    EXPECT_NO_THROW(policy.Validate("requests[socks,security]>=2"));
    EXPECT_NO_THROW(policy.Validate("zope.interface!=5.0"));
    EXPECT_NO_THROW(policy.Validate("six==1.*"));
    EXPECT_NO_THROW(policy.ValidateAll({}));
}

// NOLINTNEXTLINE
TEST(dependency_policy, rejects_options_and_injection) {
    DependencyPolicy policy;
    EXPECT_THROW(policy.Validate(""), SecurityError);
    EXPECT_THROW(policy.Validate("--index-url=http://evil"), SecurityError);
    EXPECT_THROW(policy.Validate("-e"), SecurityError);
    EXPECT_THROW(policy.Validate("pytest; rm -rf /"), SecurityError);
    EXPECT_THROW(policy.Validate("pytest&&id"), SecurityError);
    EXPECT_THROW(policy.Validate("$(id)"), SecurityError);
    EXPECT_THROW(policy.Validate("`id`"), SecurityError);
    EXPECT_THROW(policy.Validate("py test"), SecurityError);
    EXPECT_THROW(policy.Validate("pytest\n"), SecurityError);
}

// NOLINTNEXTLINE
TEST(dependency_policy, rejects_urls_and_paths) {
    DependencyPolicy policy;
    EXPECT_THROW(policy.Validate("git+https://github.com/x/y.git"), SecurityError);
    EXPECT_THROW(policy.Validate("https://example.com/pkg.whl"), SecurityError);
    EXPECT_THROW(policy.Validate("pkg@https://example.com/pkg.whl"), SecurityError);
    EXPECT_THROW(policy.Validate("./local"), SecurityError);
    EXPECT_THROW(policy.Validate("../up"), SecurityError);
    EXPECT_THROW(policy.Validate("/abs/pkg"), SecurityError);
    EXPECT_THROW(policy.Validate(".hidden"), SecurityError);
}

// NOLINTNEXTLINE
TEST(dependency_policy, rejects_malformed_specifiers) {
    DependencyPolicy policy;
    EXPECT_THROW(policy.Validate("pkg=="), SecurityError);
    EXPECT_THROW(policy.Validate("pkg[extra"), SecurityError);
    EXPECT_THROW(policy.Validate("_pkg"), SecurityError);
    EXPECT_THROW(policy.Validate("pkg=1.0"), SecurityError);
}

// NOLINTNEXTLINE
TEST(dependency_policy, blocks_by_normalized_name) {
    DependencyPolicy policy({"Evil_Package", " ", "crypto.miner"});
    EXPECT_THROW(policy.Validate("evil-package"), SecurityError);
    EXPECT_THROW(policy.Validate("EVIL.package==1.0"), SecurityError);
    EXPECT_THROW(policy.Validate("crypto-miner[all]"), SecurityError);
    EXPECT_NO_THROW(policy.Validate("evil-packages"));
    EXPECT_THROW(policy.ValidateAll({"pytest", "evil__package"}), SecurityError);
}

// NOLINTNEXTLINE
TEST(dependency_policy, normalize_and_name_of) {
    EXPECT_EQ(DependencyPolicy::NormalizeName("Foo__Bar.baz"), "foo-bar-baz");
    EXPECT_EQ(DependencyPolicy::NormalizeName("pytest"), "pytest");
    EXPECT_EQ(DependencyPolicy::NameOf("Requests[socks]>=2"), "Requests");
    EXPECT_EQ(DependencyPolicy::NameOf("six~=1.16"), "six");
    EXPECT_EQ(DependencyPolicy::NameOf("pytest"), "pytest");
}
