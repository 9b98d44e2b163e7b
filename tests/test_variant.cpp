#include <gtest/gtest.h>

#include "errors.h"
#include "genotype.h"
#include "variant.h"

using namespace genocol;

TEST(VariantTest, DefaultsToAnonymousDiploidSite) {
    VariantPtr v = Variant::Create();
    EXPECT_EQ(v->Ref(), "N");
    EXPECT_EQ(v->Ploidy(), 2);
    EXPECT_EQ(v->NumAlleles(), 1u);
    EXPECT_FALSE(v->Score().has_value());
    EXPECT_TRUE(v->Chromosome().empty());
    EXPECT_FALSE(v->Id().empty());
    EXPECT_NE(v->Id(), Variant::Create()->Id());
}

TEST(VariantTest, AllelePaletteLookup) {
    VariantPtr v = Variant::Create("1", 123, "rs1", "A", {"T"});
    EXPECT_EQ(v->GetIdxFromAllele("A"), 0);
    EXPECT_EQ(v->GetIdxFromAllele("T"), 1);
    EXPECT_EQ(v->GetIdxFromAllele("."), kMissingIdx);
    EXPECT_EQ(v->GetIdxFromAllele(""), kMissingIdx);
    EXPECT_THROW(v->GetIdxFromAllele("G"), UnknownAllele);
    EXPECT_EQ(v->NumAlleles(), 2u);

    EXPECT_EQ(v->GetIdxFromAllele("G", true), 2);
    EXPECT_EQ(v->Alleles(), (std::vector<std::string>{"A", "T", "G"}));
    EXPECT_EQ(v->Alt(), "T,G");

    EXPECT_EQ(v->GetAlleleFromIdx(1), "T");
    EXPECT_EQ(v->GetAlleleFromIdx(kMissingIdx), ".");
    EXPECT_THROW(v->GetAlleleFromIdx(3), InvalidAlleleIndex);
}

TEST(VariantTest, ValidAlleleIndices) {
    VariantPtr v = Variant::Create("1", 1, "rs1", "A", {"T"});
    EXPECT_TRUE(v->IsValidAlleleIdx(0));
    EXPECT_TRUE(v->IsValidAlleleIdx(1));
    EXPECT_TRUE(v->IsValidAlleleIdx(kMissingIdx));
    EXPECT_FALSE(v->IsValidAlleleIdx(2));
    EXPECT_FALSE(v->IsValidAlleleIdx(-1));
}

TEST(VariantTest, PaletteIsCappedAt254Alleles) {
    VariantPtr v = Variant::Create("1", 1, "big", "A");
    for (int i = 1; i < 254; ++i) {
        v->AddAllele("ALT" + std::to_string(i));
    }
    EXPECT_EQ(v->NumAlleles(), kMaxAlleles);
    EXPECT_THROW(v->GetIdxFromAllele("ONE_TOO_MANY", true), TooManyAlleles);
    // existing alleles are still found
    EXPECT_EQ(v->AddAllele("ALT3"), 3);
}

TEST(VariantTest, RejectsInvalidFields) {
    EXPECT_THROW(Variant::Create("1;2", 1, "rs1", "A"), InvalidValue);
    EXPECT_THROW(Variant::Create("1", 1, "rs,1", "A"), InvalidValue);
    EXPECT_THROW(Variant::Create("1", kMaxPosition + 1, "rs1", "A"), InvalidValue);
    EXPECT_NO_THROW(Variant::Create("1", kMaxPosition, "rs1", "A"));
    EXPECT_THROW(Variant::Create("1", 1, "rs1", "."), InvalidValue);
    EXPECT_THROW(Variant::Create("1", 1, "rs1", "A", {"A"}), InvalidValue);
    EXPECT_THROW(Variant::Create("1", 1, "rs1", "A", {"T", "T"}), InvalidValue);
    EXPECT_THROW(Variant::Create("1", 1, "rs1", "A", {"T"}, 0), InvalidValue);
}

TEST(VariantTest, SamePositionIgnoresAlternates) {
    VariantPtr a = Variant::Create("1", 10, "rs1", "A", {"T"});
    VariantPtr b = Variant::Create("1", 10, "rs1", "A", {"G", "C"});
    VariantPtr c = Variant::Create("1", 10, "rs2", "A", {"T"});
    VariantPtr d = Variant::Create("1", 10, "rs1", "A", {"T"}, 3);
    EXPECT_TRUE(a->IsSamePosition(*b));
    EXPECT_FALSE(a->IsSamePosition(*c));
    EXPECT_FALSE(a->IsSamePosition(*d));
    EXPECT_FALSE(*a == *b);
}

TEST(VariantTest, EqualityIncludesScore) {
    VariantPtr a = Variant::Create("1", 10, "rs1", "A", {"T"}, 2, 30);
    VariantPtr b = Variant::Create("1", 10, "rs1", "A", {"T"}, 2, 30);
    VariantPtr c = Variant::Create("1", 10, "rs1", "A", {"T"}, 2);
    EXPECT_EQ(*a, *b);
    EXPECT_NE(*a, *c);
    EXPECT_EQ(*a->Clone(), *a);
    EXPECT_NE(a->Clone(), a);
}

TEST(VariantTest, MakeGenotypePadsAndSorts) {
    VariantPtr v = Variant::Create("1", 10, "rs1", "A", {"T"});
    EXPECT_EQ(v->MakeGenotype({"T", "A"}).AlleleIdxs(), (std::vector<uint8_t>{0, 1}));
    EXPECT_EQ(v->MakeGenotype({"T"}).AlleleIdxs(), (std::vector<uint8_t>{1, kMissingIdx}));
    EXPECT_TRUE(v->MakeGenotype({}).IsMissing());
    EXPECT_THROW(v->MakeGenotype({"A", "T", "A"}), TooManyAlleles);
    EXPECT_THROW(v->MakeGenotype({"G"}), UnknownAllele);

    Genotype added = v->MakeGenotype({"G", "A"}, true);
    EXPECT_EQ(added.AlleleIdxs(), (std::vector<uint8_t>{0, 2}));
    EXPECT_EQ(v->NumAlleles(), 3u);
}

TEST(VariantTest, MakeGenotypeFromString) {
    VariantPtr v = Variant::Create("1", 10, "rs1", "A", {"T"});
    EXPECT_EQ(v->MakeGenotypeFromStr("T/A").AlleleIdxs(), (std::vector<uint8_t>{0, 1}));
    EXPECT_EQ(v->MakeGenotypeFromStr("T|T", "|").AlleleIdxs(), (std::vector<uint8_t>{1, 1}));
    EXPECT_EQ(v->MakeGenotypeFromStr("A/.").AlleleIdxs(), (std::vector<uint8_t>{0, kMissingIdx}));
    EXPECT_TRUE(v->MakeGenotypeFromStr("").IsMissing());
    EXPECT_TRUE(v->MakeGenotypeFromStr("./.").IsMissing());
    EXPECT_TRUE(v->MakeGenotypeFromStr(".").IsMissing());
    EXPECT_THROW(v->MakeGenotypeFromStr("A/A/T"), TooManyAlleles);
}

TEST(VariantTest, MakeGenotypeFromPlinkBits) {
    VariantPtr v = Variant::Create("1", 10, "rs1", "A", {"T"});
    EXPECT_EQ(v->MakeGenotypeFromPlinkBits("00").AlleleIdxs(), (std::vector<uint8_t>{0, 0}));
    EXPECT_TRUE(v->MakeGenotypeFromPlinkBits("01").IsMissing());
    EXPECT_EQ(v->MakeGenotypeFromPlinkBits("10").AlleleIdxs(), (std::vector<uint8_t>{0, 1}));
    EXPECT_EQ(v->MakeGenotypeFromPlinkBits("11").AlleleIdxs(), (std::vector<uint8_t>{1, 1}));
    EXPECT_THROW(v->MakeGenotypeFromPlinkBits("12"), InvalidValue);

    EXPECT_THROW(Variant::Create("1", 10, "rs2", "A", {"T", "G"})->MakeGenotypeFromPlinkBits("00"),
                 UnsupportedMultiAllelic);
    EXPECT_THROW(Variant::Create("1", 10, "rs3", "A", {"T"}, 3)->MakeGenotypeFromPlinkBits("00"),
                 UnsupportedPloidy);
}

TEST(VariantTest, MakeGenotypeFromVcfRecord) {
    VariantPtr v = Variant::Create("1", 10, "rs1", "A", {"T"});
    Genotype gt = v->MakeGenotypeFromVcfRecord({1, -1}, 40);
    EXPECT_EQ(gt.AlleleIdxs(), (std::vector<uint8_t>{1, kMissingIdx}));
    EXPECT_EQ(gt.Score(), std::optional<uint8_t>(40));
    EXPECT_TRUE(v->MakeGenotypeFromVcfRecord({-1, -1}).IsMissing());
    EXPECT_EQ(v->MakeGenotypeFromVcfRecord({0}).AlleleIdxs(), (std::vector<uint8_t>{0, kMissingIdx}));
    EXPECT_THROW(v->MakeGenotypeFromVcfRecord({2, 0}), InvalidAlleleIndex);
    EXPECT_THROW(v->MakeGenotypeFromVcfRecord({-2, 0}), InvalidAlleleIndex);
    EXPECT_THROW(v->MakeGenotypeFromVcfRecord({0, 0, 1}), TooManyAlleles);
}

TEST(VariantDtypeTest, FormatsAndParses) {
    VariantPtr v = Variant::Create("12", 112161652, "rs12462", "T", {"C"});
    EXPECT_EQ(FormatDtype(*v), "genotype(2n)[12; 112161652; rs12462; T; C]");
    EXPECT_EQ(*ParseDtype(FormatDtype(*v)), *v);

    VariantPtr scored = Variant::Create("12", 112161652, "rs12462", "T", {"C", "G"}, 3, 30);
    EXPECT_EQ(FormatDtype(*scored), "genotype(3n)[12; 112161652; rs12462; T; C,G]Q30");
    EXPECT_EQ(*ParseDtype(FormatDtype(*scored)), *scored);
}

TEST(VariantDtypeTest, UnknownChromosomeAndNoAlternate) {
    VariantPtr v = Variant::Create("", 0, "site", "A");
    EXPECT_EQ(FormatDtype(*v), "genotype(2n)[.; 0; site; A; .]");
    VariantPtr parsed = ParseDtype(FormatDtype(*v));
    EXPECT_TRUE(parsed->Chromosome().empty());
    EXPECT_EQ(parsed->NumAlleles(), 1u);
    EXPECT_EQ(*parsed, *v);
}

TEST(VariantDtypeTest, RejectsMalformedStrings) {
    EXPECT_THROW(ParseDtype("genotype(2n)[12; 112161652; T; C]"), InvalidValue);
    EXPECT_THROW(ParseDtype("genotype(2n)[12; 112161652; rs1; T; C]q35"), InvalidValue);
    EXPECT_THROW(ParseDtype("genotype(xn)[12; 1; rs1; T; C]"), InvalidValue);
    EXPECT_THROW(ParseDtype("genotype[rs12462; 12; 112161652; T,C]"), InvalidValue);
    EXPECT_THROW(ParseDtype("int64"), InvalidValue);
}

TEST(GenotypeErrorTest, KindAndMessage) {
    try {
        Variant::Create("1", 1, "rs1", "A", {"T"})->GetIdxFromAllele("G");
        FAIL() << "expected UnknownAllele";
    } catch (const GenotypeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnknownAllele);
        EXPECT_EQ(std::string(e.what()).rfind("UnknownAllele: ", 0), 0u);
    }

    IoError io("cannot open x.bed");
    EXPECT_EQ(io.kind(), ErrorKind::IoError);
    EXPECT_STREQ(io.what(), "IoError: cannot open x.bed");
    EXPECT_STREQ(ErrorKindName(ErrorKind::UnsupportedMultiAllelic), "UnsupportedMultiAllelic");
    EXPECT_THROW(throw CorruptFile("bad magic"), std::runtime_error);
}
