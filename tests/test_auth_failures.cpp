/**
 * @file test_auth_failures.cpp
 * @brief Tests for login form weaknesses and default admin login pages
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "checks/auth_failures.h"
#include "core/findings.h"
#include "helpers/http_test_helpers.h"
#include <set>
#include <string>

using test_helpers::html;

namespace {

struct Fixture {
    test_helpers::FakeHttpClient client;
    ScanConfig config = test_helpers::fast_config();
    logging::NullObserver events;
    ProbeLimiter probes;
    ScanContext ctx{client, config, events, probes};
};

Form login_form() {
    Form form;
    form.action = "http://site.test/login";
    form.method = "post";
    form.inputs = {{"user", "text", ""}, {"pass", "password", ""}, {"go", "submit", "Sign in"}};
    return form;
}

CrawlResult login_page(const std::string& body) {
    CrawlResult page;
    page.url = "http://site.test/login";
    page.status = 200;
    page.content_type = "text/html";
    page.body = body;
    page.forms = {login_form()};
    return page;
}

std::set<std::string> types_of(const std::vector<Finding>& findings) {
    std::set<std::string> types;
    for (const auto& f : findings) types.insert(f.type);
    return types;
}

} // namespace

TEST_CASE("Login form heuristics", "[auth]") {
    REQUIRE(AuthFailuresAnalyzer::is_login_form(login_form()));
    Form search;
    search.inputs = {{"q", "text", ""}};
    REQUIRE_FALSE(AuthFailuresAnalyzer::is_login_form(search));

    Form with_captcha = login_form();
    with_captcha.inputs.push_back({"g-recaptcha-response", "hidden", ""});
    REQUIRE(AuthFailuresAnalyzer::has_captcha(with_captcha));
    REQUIRE_FALSE(AuthFailuresAnalyzer::has_captcha(login_form()));

    REQUIRE(AuthFailuresAnalyzer::has_2fa_indicators("Enter the verification code from your app"));
    REQUIRE_FALSE(AuthFailuresAnalyzer::has_2fa_indicators("Sign in to continue"));

    REQUIRE(AuthFailuresAnalyzer::has_weak_password_policy("<p>Choose a password</p>"));
    REQUIRE_FALSE(AuthFailuresAnalyzer::has_weak_password_policy("Password must be at least 12 characters"));
}

TEST_CASE("Unprotected login form", "[auth]") {
    Fixture fx;
    fx.client.on("POST", "http://site.test/login", html("<p>Invalid username or password</p>"));

    AuthFailuresAnalyzer analyzer;
    std::vector<Finding> findings;
    analyzer.check(login_page("<form>Sign in</form>"), fx.ctx, findings);

    REQUIRE(types_of(findings) == std::set<std::string>{
        "auth_failure_no_captcha",
        "auth_failure_no_2fa",
        "auth_failure_weak_password_policy",
        "auth_failure_no_brute_force_protection",
    });
    for (const auto& f : findings) {
        REQUIRE(f.details["form_action"] == "http://site.test/login");
        REQUIRE(f.details["form_method"] == "post");
        REQUIRE(has_required_details(f));
    }
    REQUIRE(fx.client.count_method("POST") == 3);

    SECTION("Probe sends distinct random credentials") {
        auto requests = fx.client.requests();
        REQUIRE(requests[0].body.find("user=") != std::string::npos);
        REQUIRE(requests[0].body.find("%40example.com") != std::string::npos);
        REQUIRE(requests[0].body != requests[1].body);
        REQUIRE(requests[0].body.find("go=") == std::string::npos);
    }
}

TEST_CASE("Protected login form", "[auth]") {
    Fixture fx;
    fx.client.on("POST", "http://site.test/login", html("<p>Too many login attempts. Account locked.</p>"));

    AuthFailuresAnalyzer analyzer;
    std::vector<Finding> findings;
    analyzer.check(login_page("<p>Use your authenticator app. Password requirements: 12 characters</p>"),
                   fx.ctx, findings);

    REQUIRE(types_of(findings) == std::set<std::string>{"auth_failure_no_captcha"});
    REQUIRE(fx.client.count_method("POST") == 1);
}

TEST_CASE("Brute-force probe gating", "[auth]") {
    Fixture fx;

    SECTION("Disabled by configuration") {
        fx.config.probe_brute_force = false;
        AuthFailuresAnalyzer analyzer;
        std::vector<Finding> findings;
        analyzer.check(login_page(""), fx.ctx, findings);
        REQUIRE(fx.client.requests().empty());
        REQUIRE(types_of(findings).count("auth_failure_no_brute_force_protection") == 0);
    }

    SECTION("Forms without a username field are not probed") {
        Form pin_only;
        pin_only.action = "http://site.test/pin";
        pin_only.method = "post";
        pin_only.inputs = {{"pin", "password", ""}};
        REQUIRE(AuthFailuresAnalyzer::has_brute_force_protection(pin_only, fx.ctx));
        REQUIRE(fx.client.requests().empty());
    }

    SECTION("Transport failure counts as protected") {
        fx.client.fail("http://site.test/login");
        REQUIRE(AuthFailuresAnalyzer::has_brute_force_protection(login_form(), fx.ctx));
    }
}

TEST_CASE("Default admin login pages", "[auth][sweep]") {
    Fixture fx;
    std::string login_html = R"(<h1>Administrator login</h1>
        <form method="post"><input name="u"><input type="password" name="p"></form>)";
    fx.client.on("http://site.test/wp-login.php", html(login_html));
    fx.client.on("http://site.test/admin", html("<h1>Admin</h1><p>No form here</p>"));
    fx.client.on("http://site.test/login", html(login_html, 401));

    AuthFailuresAnalyzer analyzer;
    std::vector<Finding> findings;
    analyzer.sweep_site("http://site.test/some/page", fx.ctx, findings);

    REQUIRE(findings.size() == 1);
    REQUIRE(findings[0].type == "auth_failure_default_login_page");
    REQUIRE(findings[0].url == "http://site.test/wp-login.php");
    REQUIRE(findings[0].details["admin_url"] == "http://site.test/wp-login.php");
    REQUIRE(has_required_details(findings[0]));
    REQUIRE(fx.client.requests().size() == AuthFailuresAnalyzer::admin_login_paths().size());
}
