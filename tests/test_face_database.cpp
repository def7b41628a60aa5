/*
 * (c) 2021 Mitch Altman, 2014 Micah Elizabeth Scott
 * http://creativecommons.org/licenses/by-sa/4.0/
 */

#include <stdio.h>
#include <string>
#include <gtest/gtest.h>
#include "lib/face_database.h"


static cv::Mat feature(float a, float b, float c, float d)
{
    cv::Mat m(1, 4, CV_32F);
    m.at<float>(0, 0) = a;
    m.at<float>(0, 1) = b;
    m.at<float>(0, 2) = c;
    m.at<float>(0, 3) = d;
    return m;
}

TEST(FaceDatabaseTest, EmptyDatabaseKnowsNobody)
{
    FaceDatabase db;
    EXPECT_EQ(0u, db.size());
    EXPECT_EQ(0u, db.numPeople());
    EXPECT_EQ("Unknown", db.identify(feature(1, 0, 0, 0), 1.0));
}

TEST(FaceDatabaseTest, NearestNameWins)
{
    FaceDatabase db;
    db.add("frank_sinatra", feature(1, 0, 0, 0));
    db.add("frank_sinatra", feature(0.9f, 0.1f, 0, 0));
    db.add("sandra_dee", feature(0, 0, 1, 0));

    EXPECT_EQ(3u, db.size());
    EXPECT_EQ(2u, db.numPeople());

    EXPECT_EQ("frank_sinatra", db.identify(feature(0.95f, 0.05f, 0, 0), 0.5));
    EXPECT_EQ("sandra_dee", db.identify(feature(0, 0, 0.9f, 0.1f), 0.5));
    EXPECT_EQ("Unknown", db.identify(feature(0, 0, 0, 1), 0.5));
}

TEST(FaceDatabaseTest, MostVotesWin)
{
    FaceDatabase db;
    db.add("adrian", feature(0, 1, 0, 0));
    db.add("mitch", feature(1, 0, 0, 0));
    db.add("mitch", feature(1, 0.1f, 0, 0));

    // Everything is within tolerance; mitch has more encodings
    EXPECT_EQ("mitch", db.identify(feature(0.5f, 0.5f, 0, 0), 2.0));
}

TEST(FaceDatabaseTest, TiesGoToFirstName)
{
    FaceDatabase db;
    db.add("barry_manilow", feature(1, 0, 0, 0));
    db.add("billy_joel", feature(0, 1, 0, 0));

    EXPECT_EQ("barry_manilow", db.identify(feature(0.5f, 0.5f, 0, 0), 1.0));
}

TEST(FaceDatabaseTest, ToleranceIsInclusive)
{
    FaceDatabase db;
    db.add("herb_alpert", feature(0, 0, 0, 0));

    EXPECT_EQ("herb_alpert", db.identify(feature(1, 0, 0, 0), 1.0));
    EXPECT_EQ("Unknown", db.identify(feature(1, 0, 0, 0), 0.99));
}

TEST(FaceDatabaseTest, MismatchedLengthsNeverMatch)
{
    FaceDatabase db;
    db.add("ian_malcolm", feature(0, 0, 0, 0));

    cv::Mat shortFeature = cv::Mat::zeros(1, 3, CV_32F);
    EXPECT_EQ("Unknown", db.identify(shortFeature, 10.0));
}

TEST(FaceDatabaseTest, FeaturesAreStoredAsFloatRows)
{
    FaceDatabase db;
    cv::Mat column = cv::Mat::ones(4, 1, CV_64F);
    db.add("claude_ciari", column);

    EXPECT_EQ(1, db.entry(0).feature.rows);
    EXPECT_EQ(4, db.entry(0).feature.cols);
    EXPECT_EQ(CV_32F, db.entry(0).feature.type());
    EXPECT_EQ("claude_ciari", db.identify(feature(1, 1, 1, 1), 0.01));
}

TEST(FaceDatabaseTest, SaveAndLoad)
{
    std::string path = testing::TempDir() + "lounge_faces_test.yml";

    FaceDatabase db;
    db.add("dianna_ross", feature(0.25f, 0.5f, 0.75f, 1));
    db.add("henry_mancini", feature(-1, 0, 1, 0));
    ASSERT_TRUE(db.save(path.c_str()));

    FaceDatabase loaded;
    ASSERT_TRUE(loaded.load(path.c_str()));
    ASSERT_EQ(2u, loaded.size());
    EXPECT_EQ("dianna_ross", loaded.entry(0).name);
    EXPECT_EQ("henry_mancini", loaded.entry(1).name);
    EXPECT_FLOAT_EQ(0.75f, loaded.entry(0).feature.at<float>(0, 2));
    EXPECT_FLOAT_EQ(-1.0f, loaded.entry(1).feature.at<float>(0, 0));

    remove(path.c_str());
}

TEST(FaceDatabaseTest, LoadMissingFile)
{
    FaceDatabase db;
    db.add("walter_wanderley", feature(0, 0, 0, 0));
    EXPECT_FALSE(db.load("/nonexistent/encodings.yml"));
    EXPECT_EQ(1u, db.size());
}
