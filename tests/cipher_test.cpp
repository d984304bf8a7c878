#include <gtest/gtest.h>

#include <tubedown/cipher.hpp>

using namespace tubedown;
using namespace tubedown::cipher;

namespace {

CipherProgram program(std::string_view text) {
	auto res = parse_cipher_program("test", text);
	EXPECT_TRUE(res.has_value()) << text;
	return res.value();
}

std::string run_recorded(std::string_view key, std::string_view token) {
	auto prog = lookup_cipher(key);
	EXPECT_TRUE(prog.has_value()) << key;
	return decipher(prog.value(), token);
}

}  // namespace

// =============================================================================
// Parser
// =============================================================================

TEST(CipherProgramTest, ParsesCompactForm) {
	auto p = program("1588 r s3 w19 r s2");
	EXPECT_EQ(p.timestamp_param, 1588);
	ASSERT_EQ(p.steps.size(), 5u);
	EXPECT_EQ(p.steps[0], (CipherStep{CipherOp::reverse, 0}));
	EXPECT_EQ(p.steps[1], (CipherStep{CipherOp::slice_from, 3}));
	EXPECT_EQ(p.steps[2], (CipherStep{CipherOp::swap_with_index, 19}));
	EXPECT_EQ(p.to_string(), "1588 r s3 w19 r s2");
}

TEST(CipherProgramTest, ToleratesExtraWhitespace) {
	auto p = program("  16265   w15\tr  ");
	EXPECT_EQ(p.to_string(), "16265 w15 r");
}

TEST(CipherProgramTest, RejectsUnknownOps) {
	EXPECT_EQ(parse_cipher_program("k", "1 r x3").error(),
			  errc::cipher_parse_error);
	EXPECT_EQ(parse_cipher_program("k", "1 s").error(),
			  errc::cipher_parse_error);
	EXPECT_EQ(parse_cipher_program("k", "1 w-4").error(),
			  errc::cipher_parse_error);
	EXPECT_EQ(parse_cipher_program("k", "r s3").error(),
			  errc::cipher_parse_error);
	EXPECT_EQ(parse_cipher_program("k", "").error(),
			  errc::cipher_parse_error);
}

// =============================================================================
// Interpreter
// =============================================================================

TEST(DecipherTest, ReverseSliceSwap) {
	EXPECT_EQ(decipher(program("100 r s2 w5"), "QWERTYUIOPASDFGHJKLZXCVBNM"),
			  "LVCXZBKJHGFDSAPOIUYTREWQ");
}

TEST(DecipherTest, SwapIndexWrapsAroundLength) {
	EXPECT_EQ(decipher(program("1 w7"), "abc"), "bac");
	EXPECT_EQ(decipher(program("1 w3"), "abc"), "abc");
}

TEST(DecipherTest, SliceBeyondLengthEmptiesToken) {
	EXPECT_EQ(decipher(program("1 s100"), "abcdef"), "");
	EXPECT_EQ(decipher(program("1 s6"), "abcdef"), "");
	EXPECT_EQ(decipher(program("1 s100 w3 r"), "abcdef"), "");
}

TEST(DecipherTest, EmptyProgramIsIdentity) {
	EXPECT_EQ(decipher(program("42"), "abc.def"), "abc.def");
}

TEST(DecipherTest, IsPure) {
	auto p = program("1586 w52 r s3 w21 r s3 r");
	const std::string token =
		"5AEEAE0EC39677BC65FD9021CCD115F1F2DBD5A59E4."
		"C0B243A3E2DED6769199AF3461781E75122AE135135";
	EXPECT_EQ(decipher(p, token), decipher(p, token));
}

// =============================================================================
// Recorded programs against recorded signatures
// =============================================================================

TEST(RecordedCipherTest, VflmOfVEX) {
	EXPECT_EQ(run_recorded("vflmOfVEX",
						   "5AEEAE0EC39677BC65FD9021CCD115F1F2DBD5A59E4."
						   "C0B243A3E2DED6769199AF3461781E75122AE135135"),
			  "931EA22157E1871643FA9519676DED253A342B0C."
			  "4E95A5DBD2F1F511DCC1209DF56CB77693CE0EAE");
	EXPECT_EQ(run_recorded("vflmOfVEX",
						   "7C03C0B9B947D9DCCB27CD2D1144BA8F91B7462B430."
						   "8CFE5FA73DDE66DCA33BF9F902E09B160BC42924924"),
			  "32924CB061B90E209F9FB43ACD66EDD77AF5EFC8."
			  "034B2647B19F8AB4411D2DC72BCCD9D749B9B0C3");
}

TEST(RecordedCipherTest, Vfl_ymO4Z) {
	EXPECT_EQ(run_recorded("vfl_ymO4Z",
						   "7272B1BA35548BA3939F9CE39C4E72A98BB78ABB28."
						   "560A7424D42FF070C115935232F8BDB8A1F3E05C05C"),
			  "72B1BA35548BA3939F9CE39C4E72A98BB78ABB28."
			  "560A7424D42FF070C115C35232F8BDB8A1F3E059");
}

TEST(RecordedCipherTest, EnUsVfl0Cbn9e) {
	EXPECT_EQ(run_recorded("en_US-vfl0Cbn9e",
						   "9977B9CA5435687412E6E3436260447A98CA0268."
						   "83C3A50B214CE0D9279695F4B5A31FEFEC4CFAA9AA5"),
			  "1937B9CA5435687912E6E3436260447A98CA0268."
			  "83C4A50B274CE0D9275695F4B5A31FEFEC4CFAA9");
}

TEST(RecordedCipherTest, UnknownKey) {
	EXPECT_EQ(lookup_cipher("vflDoesNotExist").error(), errc::unknown_cipher);
}

TEST(RecordedCipherTest, TableEntriesRoundTrip) {
	auto p = lookup_cipher("vfltM3odl");
	ASSERT_TRUE(p.has_value());
	EXPECT_EQ(p.value().to_string(), "1584 w60 s1 w49 r s1 w7 r s2 r");
	EXPECT_EQ(p.value().version_key, "vfltM3odl");
}

// =============================================================================
// Shape check and decipher_signature
// =============================================================================

TEST(SignatureShapeTest, TwoLongHexGroups) {
	EXPECT_TRUE(signature_shape_ok(
		"931EA22157E1871643FA9519676DED253A342B0C."
		"4E95A5DBD2F1F511DCC1209DF56CB77693CE0EAE"));
	EXPECT_FALSE(signature_shape_ok("ABCDEF.0123"));
	EXPECT_FALSE(signature_shape_ok(
		"931EA22157E1871643FA9519676DED253A342B0C"
		"4E95A5DBD2F1F511DCC1209DF56CB77693CE0EAE"));
	EXPECT_FALSE(signature_shape_ok(
		"931EA22157E1871643FA9519676DED253A342B0C.."
		"4E95A5DBD2F1F511DCC1209DF56CB77693CE0EAE"));
	EXPECT_FALSE(signature_shape_ok(""));
}

TEST(DecipherSignatureTest, GoodShapeHasNoDiagnostic) {
	auto res = decipher_signature(
		"vflmOfVEX",
		"5AEEAE0EC39677BC65FD9021CCD115F1F2DBD5A59E4."
		"C0B243A3E2DED6769199AF3461781E75122AE135135");
	ASSERT_TRUE(res.has_value());
	EXPECT_FALSE(res.value().mismatch.has_value());
	EXPECT_EQ(res.value().program.timestamp_param, 1586);
}

TEST(DecipherSignatureTest, BadShapeIsReportedNotFailed) {
	auto res = decipher_signature("vflmOfVEX", "QWERTYUIOPASDFGHJKLZXCVBNM");
	ASSERT_TRUE(res.has_value());
	ASSERT_TRUE(res.value().mismatch.has_value());
	EXPECT_NE(res.value().mismatch->find("vflmOfVEX"), std::string::npos);
}

TEST(DecipherSignatureTest, UnknownKeyWithoutScriptFails) {
	auto res = decipher_signature("vflDoesNotExist", "abc");
	ASSERT_TRUE(res.has_error());
	EXPECT_EQ(res.error(), errc::unknown_cipher);
}
