#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <limits>

#include "errors.h"
#include "genotype_array.h"

using namespace genocol;

namespace {

std::vector<std::vector<std::string>> SortedAlleles(const GenotypeArray& arr) {
    std::vector<std::vector<std::string>> out;
    for (std::size_t i = 0; i < arr.size(); ++i) {
        std::vector<std::string> alleles = arr[i].Alleles();
        std::sort(alleles.begin(), alleles.end());
        out.push_back(alleles);
    }
    return out;
}

}  // namespace

class GenotypeArrayTest : public ::testing::Test {
protected:
    VariantPtr v = Variant::Create("1", 100, "rs1", "A", {"T"});
    GenotypeArray arr = GenotypeArray::FromStrings({"A/A", "A/T", "T/T", "."}, v);
};

TEST_F(GenotypeArrayTest, BuildsFromStrings) {
    ASSERT_EQ(arr.size(), 4u);
    EXPECT_EQ(arr.Ploidy(), 2);
    EXPECT_EQ(arr.RecordSize(), 3u);
    EXPECT_EQ(arr.NBytes(), 12u);
    EXPECT_EQ(arr.GetVariant(), v);
    EXPECT_EQ(arr.IsNa(), (std::vector<bool>{false, false, false, true}));
    EXPECT_EQ(arr[1].ToString(), "A/T");
}

TEST_F(GenotypeArrayTest, StringRoundTrip) {
    GenotypeArray parsed = GenotypeArray::FromStrings({"T/A", "A/.", ".", "T/T", "A/A"}, v);
    GenotypeArray again = GenotypeArray::FromStrings(parsed.ToStrings(), v);
    EXPECT_TRUE(again.Equals(parsed));
    EXPECT_EQ(parsed.ToStrings(), (std::vector<std::string>{"A/T", "A/.", ".", "T/T", "A/A"}));
}

TEST_F(GenotypeArrayTest, FromStringsNeedsVariant) {
    EXPECT_THROW(GenotypeArray::FromStrings({"A/A"}, nullptr), InvalidValue);
    EXPECT_THROW(GenotypeArray::FromStrings({"A/G"}, v), UnknownAllele);
    GenotypeArray added = GenotypeArray::FromStrings({"A/G"}, v, "/", true);
    EXPECT_EQ(v->NumAlleles(), 3u);
    EXPECT_EQ(added[0].ToString(), "A/G");
}

TEST_F(GenotypeArrayTest, FromGenotypesChecksVariants) {
    std::vector<Genotype> gts = {v->MakeGenotype({"A", "T"}), v->MakeGenotype({"T", "T"}, false, 20)};
    GenotypeArray built = GenotypeArray::FromGenotypes(gts);
    EXPECT_EQ(built.GetVariant(), v);
    EXPECT_EQ(built.ScoreAt(1), 20);

    VariantPtr other = Variant::Create("1", 100, "rs2", "A", {"T"});
    gts.push_back(other->MakeGenotype({"A", "A"}));
    EXPECT_THROW(GenotypeArray::FromGenotypes(gts), IncompatibleVariant);

    // same position with a longer palette is accepted when the indices are valid
    VariantPtr wider = Variant::Create("1", 100, "rs1", "A", {"T", "G"});
    EXPECT_NO_THROW(GenotypeArray::FromGenotypes({wider->MakeGenotype({"A", "T"})}, v));
    EXPECT_THROW(GenotypeArray::FromGenotypes({wider->MakeGenotype({"A", "G"})}, v), InvalidAlleleIndex);

    EXPECT_EQ(GenotypeArray::FromGenotypes({}).size(), 0u);
}

TEST_F(GenotypeArrayTest, FromRawRecordsValidatesAndCanonicalizes) {
    GenotypeArray raw = GenotypeArray::FromRawRecords(v, {1, 0, 30, 255, 255, 255});
    EXPECT_EQ(raw.size(), 2u);
    EXPECT_EQ(raw[0].AlleleIdxs(), (std::vector<uint8_t>{0, 1}));
    EXPECT_EQ(raw.ScoreAt(0), 30);
    EXPECT_TRUE(raw[1].IsMissing());

    EXPECT_THROW(GenotypeArray::FromRawRecords(v, {0, 0}), InvalidValue);
    EXPECT_THROW(GenotypeArray::FromRawRecords(v, {0, 2, 255}), InvalidAlleleIndex);
}

TEST_F(GenotypeArrayTest, FromArrayRequiresMatchingVariant) {
    EXPECT_TRUE(GenotypeArray::FromArray(arr).Equals(arr));
    EXPECT_TRUE(GenotypeArray::FromArray(arr, v->Clone()).Equals(arr));
    EXPECT_THROW(GenotypeArray::FromArray(arr, Variant::Create("2", 5, "x", "C")), IncompatibleVariant);
}

TEST_F(GenotypeArrayTest, ScalarIndexing) {
    EXPECT_EQ(arr.At(-2).ToString(), "T/T");
    EXPECT_TRUE(arr.At(-1).IsMissing());
    EXPECT_THROW(arr.At(4), IndexOutOfBounds);
    EXPECT_THROW(arr.At(-5), IndexOutOfBounds);
}

TEST_F(GenotypeArrayTest, SliceAndMaskShareVariant) {
    GenotypeArray sliced = arr.Slice(1, 3);
    EXPECT_EQ(sliced.ToStrings(), (std::vector<std::string>{"A/T", "T/T"}));
    EXPECT_EQ(sliced.GetVariant(), arr.GetVariant());
    EXPECT_EQ(arr.Slice(0, 10, 2).ToStrings(), (std::vector<std::string>{"A/A", "T/T"}));
    EXPECT_THROW(arr.Slice(0, 2, 0), InvalidValue);

    GenotypeArray huge_step = arr.Slice(1, 3, std::numeric_limits<std::size_t>::max());
    ASSERT_EQ(huge_step.size(), 1u);
    EXPECT_EQ(huge_step[0], arr[1]);
    EXPECT_EQ(arr.Slice(2, 3, std::numeric_limits<std::size_t>::max() - 1).size(), 1u);

    GenotypeArray masked = arr.Mask({true, false, false, true});
    EXPECT_EQ(masked.ToStrings(), (std::vector<std::string>{"A/A", "."}));
    EXPECT_EQ(masked.GetVariant(), arr.GetVariant());
    EXPECT_THROW(arr.Mask({true}), IndexOutOfBounds);
}

TEST_F(GenotypeArrayTest, Take) {
    EXPECT_EQ(arr.Take({2, 0}).ToStrings(), (std::vector<std::string>{"T/T", "A/A"}));
    EXPECT_EQ(arr.Take({-1}).ToStrings(), (std::vector<std::string>{"."}));
    EXPECT_EQ(arr.Take({0, -1}, true).ToStrings(), (std::vector<std::string>{"A/A", "."}));

    Genotype fill = v->MakeGenotype({"T", "T"});
    EXPECT_EQ(arr.Take({-1, 1}, true, &fill).ToStrings(), (std::vector<std::string>{"T/T", "A/T"}));

    EXPECT_THROW(arr.Take({4}), IndexOutOfBounds);
    EXPECT_THROW(arr.Take({-2}, true), IndexOutOfBounds);
}

TEST_F(GenotypeArrayTest, CopyIsDeep) {
    GenotypeArray copied = arr.Copy();
    EXPECT_TRUE(copied.Equals(arr));
    EXPECT_NE(copied.GetVariant(), arr.GetVariant());
    copied.Set(0, copied.GetVariant()->MakeGenotype({"T", "T"}));
    EXPECT_EQ(arr[0].ToString(), "A/A");
}

TEST_F(GenotypeArrayTest, SetRows) {
    arr.Set(3, v->MakeGenotype({"A", "T"}, false, 12));
    EXPECT_EQ(arr[3].ToString(), "A/T");
    EXPECT_EQ(arr.ScoreAt(3), 12);

    arr.Set({true, true, false, false}, v->MakeGenotype({}));
    EXPECT_EQ(arr.IsNa(), (std::vector<bool>{true, true, false, false}));

    VariantPtr other = Variant::Create("1", 100, "rs2", "A", {"T"});
    EXPECT_THROW(arr.Set(0, other->MakeGenotype({"A", "A"})), IncompatibleVariant);
    EXPECT_THROW(arr.Set(9, v->MakeGenotype({"A", "A"})), IndexOutOfBounds);
}

TEST_F(GenotypeArrayTest, RowPredicates) {
    GenotypeArray gts = GenotypeArray::FromStrings({"A/A", "A/T", "T/T", ".", "A/."}, v);
    EXPECT_EQ(gts.IsHomozygous(), (std::vector<bool>{true, false, true, false, false}));
    EXPECT_EQ(gts.IsHeterozygous(), (std::vector<bool>{false, true, false, false, false}));
    EXPECT_EQ(gts.IsHomozygousRef(), (std::vector<bool>{true, false, false, false, false}));
    EXPECT_EQ(gts.IsHomozygousAlt(), (std::vector<bool>{false, false, true, false, false}));
    EXPECT_EQ(gts.IsNa(), (std::vector<bool>{false, false, false, true, false}));
}

TEST_F(GenotypeArrayTest, GtScores) {
    GenotypeArray scored = GenotypeArray::FromGenotypes(
        {v->MakeGenotype({"A", "A"}, false, 10), v->MakeGenotype({"A", "T"})}, v);
    std::vector<double> scores = scored.GtScores();
    EXPECT_DOUBLE_EQ(scores[0], 10.0);
    EXPECT_TRUE(std::isnan(scores[1]));
}

TEST_F(GenotypeArrayTest, FactorizeIgnoresScoresAndMissing) {
    GenotypeArray gts = GenotypeArray::FromGenotypes({v->MakeGenotype({"A", "T"}, false, 5),
                                                      v->MakeGenotype({"A", "A"}),
                                                      v->MakeGenotype({"T", "A"}, false, 9),
                                                      v->MakeGenotype({}),
                                                      v->MakeGenotype({"T", "T"})},
                                                     v);
    GenotypeArray uniques;
    std::vector<int64_t> codes = gts.Factorize(&uniques);
    EXPECT_EQ(codes, (std::vector<int64_t>{0, 1, 0, GenotypeArray::kNaCode, 2}));
    EXPECT_EQ(uniques.ToStrings(), (std::vector<std::string>{"A/T", "A/A", "T/T"}));
    EXPECT_EQ(uniques.GetVariant(), v);

    EXPECT_EQ(gts.Unique().ToStrings(), (std::vector<std::string>{"A/T", "A/A", ".", "T/T"}));

    auto counts = gts.ValueCounts();
    ASSERT_EQ(counts.size(), 3u);
    EXPECT_EQ(counts[0].first.ToString(), "A/T");
    EXPECT_EQ(counts[0].second, 2u);
    EXPECT_EQ(counts[1].first.ToString(), "A/A");

    auto with_na = gts.ValueCounts(false);
    ASSERT_EQ(with_na.size(), 4u);
    EXPECT_TRUE(with_na.back().first.IsMissing());
    EXPECT_EQ(with_na.back().second, 1u);
}

TEST_F(GenotypeArrayTest, ConcatRequiresIdenticalVariant) {
    GenotypeArray other = GenotypeArray::FromStrings({"T/T"}, v->Clone());
    GenotypeArray joined = GenotypeArray::Concat({arr, other});
    EXPECT_EQ(joined.size(), 5u);
    EXPECT_EQ(joined[4].ToString(), "T/T");

    VariantPtr renamed = Variant::Create("1", 100, "rs1b", "A", {"T"});
    GenotypeArray foreign = GenotypeArray::FromStrings({"T/T"}, renamed);
    EXPECT_THROW(GenotypeArray::Concat({arr, foreign}), IncompatibleVariant);

    VariantPtr wider = Variant::Create("1", 100, "rs1", "A", {"T", "G"});
    EXPECT_THROW(GenotypeArray::Concat({arr, GenotypeArray::FromStrings({"T/T"}, wider)}), IncompatibleVariant);
    EXPECT_THROW(GenotypeArray::Concat({}), InvalidValue);
}

TEST_F(GenotypeArrayTest, SetReferenceSwapsIndices) {
    std::vector<std::vector<std::string>> before = SortedAlleles(arr);
    arr.SetReference("T");
    EXPECT_EQ(arr.GetVariant()->Ref(), "T");
    EXPECT_EQ(arr.GetVariant()->Alleles(), (std::vector<std::string>{"T", "A"}));
    EXPECT_EQ(arr[0].AlleleIdxs(), (std::vector<uint8_t>{1, 1}));
    EXPECT_EQ(arr[1].AlleleIdxs(), (std::vector<uint8_t>{0, 1}));
    EXPECT_EQ(arr[2].AlleleIdxs(), (std::vector<uint8_t>{0, 0}));
    EXPECT_TRUE(arr[3].IsMissing());
    // only the labels moved
    EXPECT_EQ(SortedAlleles(arr), before);
}

TEST_F(GenotypeArrayTest, SetReferenceIsIdempotent) {
    arr.SetReference("T");
    GenotypeArray once = arr.Copy();
    arr.SetReference("T");
    EXPECT_TRUE(arr.Equals(once));

    GenotypeArray unchanged = arr.Copy();
    arr.SetReference(0);
    EXPECT_TRUE(arr.Equals(unchanged));
}

TEST_F(GenotypeArrayTest, SetReferenceClonesSharedVariant) {
    GenotypeArray view = arr.Slice(0, 2);
    arr.SetReference(1);
    EXPECT_EQ(v->Ref(), "A");
    EXPECT_EQ(view.GetVariant()->Ref(), "A");
    EXPECT_EQ(view[1].ToString(), "A/T");
    EXPECT_EQ(arr.GetVariant()->Ref(), "T");
}

TEST_F(GenotypeArrayTest, SetReferenceValidates) {
    EXPECT_THROW(arr.SetReference("G"), UnknownAllele);
    EXPECT_THROW(arr.SetReference(2), InvalidAlleleIndex);
    EXPECT_THROW(arr.SetReference(static_cast<int>(kMissingIdx)), InvalidAlleleIndex);
}

TEST_F(GenotypeArrayTest, SetReferenceKeepsRowsCanonical) {
    VariantPtr tri = Variant::Create("1", 5, "tri", "A", {"T", "G"});
    GenotypeArray gts = GenotypeArray::FromStrings({"A/T", "T/G", "A/G"}, tri);
    gts.SetReference("G");
    EXPECT_EQ(gts.GetVariant()->Alleles(), (std::vector<std::string>{"G", "T", "A"}));
    for (std::size_t i = 0; i < gts.size(); ++i) {
        const uint8_t* rec = gts.AlleleIdxs(i);
        EXPECT_LE(rec[0], rec[1]);
    }
    EXPECT_EQ(gts.ToStrings(), (std::vector<std::string>{"T/A", "G/T", "G/A"}));
}

TEST_F(GenotypeArrayTest, ElementwiseComparison) {
    Genotype het = v->MakeGenotype({"A", "T"});
    EXPECT_EQ(arr.Compare(het, CompareOp::Eq), (std::vector<bool>{false, true, false, false}));
    EXPECT_EQ(arr.Compare(het, CompareOp::Lt), (std::vector<bool>{true, false, false, false}));
    EXPECT_EQ(arr.Compare(het, CompareOp::Ge), (std::vector<bool>{false, true, true, true}));

    GenotypeArray reversed = arr.Take({3, 2, 1, 0});
    EXPECT_EQ(arr.Compare(reversed, CompareOp::Ne), (std::vector<bool>{true, true, true, true}));
    EXPECT_EQ(arr.Compare(reversed, CompareOp::Le), (std::vector<bool>{true, true, false, false}));
    EXPECT_THROW(arr.Compare(arr.Slice(0, 2), CompareOp::Eq), InvalidValue);

    VariantPtr other = Variant::Create("2", 1, "rs9", "A", {"T"});
    EXPECT_THROW(arr.Compare(other->MakeGenotype({"A"}), CompareOp::Eq), IncompatibleVariant);
}
