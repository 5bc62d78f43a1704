#pragma once

int cmd_rating(int argc, char** argv);
